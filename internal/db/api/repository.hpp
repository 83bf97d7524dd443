#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/credit_transaction_record.hpp"
#include "internal/db/model/job_record.hpp"

namespace workledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Lock* calls hold the returned rows exclusively until the
    transaction ends
  - LockNextClaimableJob / LockStaleProcessingJobs SKIP rows that a
    concurrent transaction has locked instead of blocking on them

  The DB is the source of truth for:
    job state
    account balances
    the credit transaction log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  // Assigns record.seq on success.
  virtual Result InsertJob(Transaction&, model::JobRecord& record) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::JobRecord> LockJob(Transaction&, const std::string& id) = 0;

  // Best pending job with scheduled_for <= now and attempts < max_attempts,
  // ordered by priority DESC, scheduled_for ASC, seq ASC. Empty types = any.
  virtual std::optional<model::JobRecord> LockNextClaimableJob(Transaction&, const std::vector<v1::JobType>& types, uint64_t now_ms) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord& record) = 0;

  // Newest first by created_at.
  virtual std::vector<model::JobRecord> ListJobsByOwner(Transaction&, const model::JobFilter& filter) = 0;

  // Processing jobs whose COALESCE(heartbeat_at, started_at) < cutoff.
  virtual std::vector<model::JobRecord> LockStaleProcessingJobs(Transaction&, uint64_t cutoff_ms, uint32_t limit) = 0;

  // Terminal jobs with completed_at < cutoff.
  virtual Result DeleteTerminalJobsCompletedBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) = 0;

  virtual std::vector<model::StatusCount> CountJobsByStatusSince(Transaction&, uint64_t created_after_ms) = 0;

  // pending/processing only
  virtual std::vector<model::TypeStatusCount> CountActiveJobsByType(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Accounts
  // ---------------------------------------------------------------------

  virtual Result InsertAccount(Transaction&, const model::AccountRecord& record) = 0;

  virtual std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::AccountRecord> LockAccount(Transaction&, const std::string& id) = 0;

  virtual Result UpdateAccount(Transaction&, const model::AccountRecord& record) = 0;

  // ---------------------------------------------------------------------
  // Credit transactions
  // ---------------------------------------------------------------------

  // Assigns record.seq on success.
  virtual Result InsertCreditTransaction(Transaction&, model::CreditTransactionRecord& record) = 0;

  // Newest first: created_at DESC, seq DESC.
  virtual std::vector<model::CreditTransactionRecord> ListCreditTransactions(Transaction&, const std::string& account_id,
                                                                             const model::Pagination& page) = 0;

  virtual int64_t SumCreditTransactions(Transaction&, const std::string& account_id) = 0;
};

} // namespace workledger::db
