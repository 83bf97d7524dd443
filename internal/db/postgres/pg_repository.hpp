#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace workledger::db::postgres {

/*
  Production backend.

  Claim and stale-job selection use FOR UPDATE SKIP LOCKED so competing
  workers never queue behind each other's candidate row; single-row
  mutations lock with plain FOR UPDATE.
*/

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertJob(Transaction&, model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::optional<model::JobRecord> LockJob(Transaction&, const std::string&) override;
  std::optional<model::JobRecord> LockNextClaimableJob(Transaction&, const std::vector<v1::JobType>& types, uint64_t now_ms) override;
  Result                          UpdateJob(Transaction&, const model::JobRecord&) override;
  std::vector<model::JobRecord>   ListJobsByOwner(Transaction&, const model::JobFilter&) override;
  std::vector<model::JobRecord>   LockStaleProcessingJobs(Transaction&, uint64_t cutoff_ms, uint32_t limit) override;
  Result                          DeleteTerminalJobsCompletedBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) override;
  std::vector<model::StatusCount> CountJobsByStatusSince(Transaction&, uint64_t created_after_ms) override;
  std::vector<model::TypeStatusCount> CountActiveJobsByType(Transaction&) override;

  Result                              InsertAccount(Transaction&, const model::AccountRecord&) override;
  std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string&) override;
  std::optional<model::AccountRecord> LockAccount(Transaction&, const std::string&) override;
  Result                              UpdateAccount(Transaction&, const model::AccountRecord&) override;

  Result InsertCreditTransaction(Transaction&, model::CreditTransactionRecord&) override;
  std::vector<model::CreditTransactionRecord> ListCreditTransactions(Transaction&, const std::string& account_id,
                                                                     const model::Pagination& page) override;
  int64_t SumCreditTransactions(Transaction&, const std::string& account_id) override;

 private:
  static PgTransaction& TX(Transaction&);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace workledger::db::postgres
