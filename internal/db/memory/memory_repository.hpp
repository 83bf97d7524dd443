#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace workledger::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and embedded use.

  Writers are serialized: a MemoryTransaction owns writer_mutex_ from
  Begin() until Commit()/Rollback(), so every Lock* call trivially
  holds its rows and the lock-and-skip calls never see a locked row.
*/

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // keyed by seq so iteration follows insertion order
    std::map<uint64_t, model::JobRecord>      jobs;
    std::unordered_map<std::string, uint64_t> job_seq_by_id;
    uint64_t                                  next_job_seq = 1;

    std::unordered_map<std::string, model::AccountRecord> accounts;

    std::vector<model::CreditTransactionRecord> credit_transactions;
    uint64_t                                    next_credit_tx_seq = 1;
  };

  std::mutex writer_mutex_;
  State      committed_;
};

} // namespace workledger::db::memory
