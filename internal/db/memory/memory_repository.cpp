#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/state_machine.hpp"
#include "memory_tx.hpp"

namespace workledger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.job_seq_by_id.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job exists: " + r.id);
  if (!s.accounts.contains(r.owner_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown owner: " + r.owner_id);

  r.seq                   = s.next_job_seq++;
  s.jobs[r.seq]           = r;
  s.job_seq_by_id[r.id]   = r.seq;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.job_seq_by_id.find(id);
  if (it == s.job_seq_by_id.end()) return std::nullopt;
  return s.jobs.at(it->second);
}

std::optional<model::JobRecord> MemoryRepository::LockJob(Transaction& t, const std::string& id) {
  // the transaction already holds the writer lock
  return GetJob(t, id);
}

std::optional<model::JobRecord> MemoryRepository::LockNextClaimableJob(Transaction& t, const std::vector<v1::JobType>& types, uint64_t now_ms) {
  const auto&             s    = TX(t).View();
  const model::JobRecord* best = nullptr;

  for (const auto& [seq, job] : s.jobs) {
    if (job.status != v1::JOB_STATUS_PENDING) continue;
    if (job.scheduled_for_ms > now_ms) continue;
    if (job.attempts >= job.max_attempts) continue;
    if (!types.empty() && std::find(types.begin(), types.end(), job.type) == types.end()) continue;

    if (!best || job.priority > best->priority || (job.priority == best->priority && job.scheduled_for_ms < best->scheduled_for_ms)) {
      // seq ascending iteration keeps the earliest insert on full ties
      best = &job;
    }
  }

  if (!best) return std::nullopt;
  return *best;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.job_seq_by_id.find(r.id);
  if (it == s.job_seq_by_id.end()) return Result::Err(ErrorCode::NotFound, "job not found: " + r.id);

  auto& row = s.jobs.at(it->second);
  auto  seq = row.seq;
  row       = r;
  row.seq   = seq;
  return Result::Ok();
}

std::vector<model::JobRecord> MemoryRepository::ListJobsByOwner(Transaction& t, const model::JobFilter& f) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> out;

  for (const auto& [seq, job] : s.jobs) {
    if (job.owner_id != f.owner_id) continue;
    if (f.status && job.status != *f.status) continue;
    if (f.type && job.type != *f.type) continue;
    out.push_back(job);
  }

  std::stable_sort(out.begin(), out.end(), [](const model::JobRecord& a, const model::JobRecord& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.seq > b.seq;
  });

  if (out.size() > f.limit) out.resize(f.limit);
  return out;
}

std::vector<model::JobRecord> MemoryRepository::LockStaleProcessingJobs(Transaction& t, uint64_t cutoff_ms, uint32_t limit) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> out;

  for (const auto& [seq, job] : s.jobs) {
    if (out.size() >= limit) break;
    if (job.status != v1::JOB_STATUS_PROCESSING) continue;

    uint64_t last_seen = job.heartbeat_at_ms.value_or(job.started_at_ms.value_or(0));
    if (last_seen < cutoff_ms) out.push_back(job);
  }
  return out;
}

Result MemoryRepository::DeleteTerminalJobsCompletedBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = 0;

  for (auto it = s.jobs.begin(); it != s.jobs.end();) {
    const auto& job = it->second;
    if (workledger::model::IsTerminal(job.status) && job.completed_at_ms && *job.completed_at_ms < cutoff_ms) {
      s.job_seq_by_id.erase(job.id);
      it = s.jobs.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

std::vector<model::StatusCount> MemoryRepository::CountJobsByStatusSince(Transaction& t, uint64_t created_after_ms) {
  const auto&                             s = TX(t).View();
  std::map<v1::JobStatus, uint64_t>       counts;

  for (const auto& [seq, job] : s.jobs) {
    if (job.created_at_ms > created_after_ms) counts[job.status]++;
  }

  std::vector<model::StatusCount> out;
  for (const auto& [status, n] : counts) {
    out.push_back({status, n});
  }
  return out;
}

std::vector<model::TypeStatusCount> MemoryRepository::CountActiveJobsByType(Transaction& t) {
  const auto&                                               s = TX(t).View();
  std::map<std::pair<v1::JobType, v1::JobStatus>, uint64_t> counts;

  for (const auto& [seq, job] : s.jobs) {
    if (workledger::model::IsActive(job.status)) counts[{job.type, job.status}]++;
  }

  std::vector<model::TypeStatusCount> out;
  for (const auto& [key, n] : counts) {
    out.push_back({key.first, key.second, n});
  }
  return out;
}

// ---------------------------------------------------------------------------
// Accounts
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertAccount(Transaction& t, const model::AccountRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.accounts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "account exists: " + r.id);
  if (r.credits_remaining < 0) return Result::Err(ErrorCode::ConstraintViolation, "credits_remaining < 0");
  s.accounts[r.id] = r;
  return Result::Ok();
}

std::optional<model::AccountRecord> MemoryRepository::GetAccount(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.accounts.find(id);
  if (it == s.accounts.end()) return std::nullopt;
  return it->second;
}

std::optional<model::AccountRecord> MemoryRepository::LockAccount(Transaction& t, const std::string& id) {
  return GetAccount(t, id);
}

Result MemoryRepository::UpdateAccount(Transaction& t, const model::AccountRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.accounts.find(r.id);
  if (it == s.accounts.end()) return Result::Err(ErrorCode::NotFound, "account not found: " + r.id);
  if (r.credits_remaining < 0) return Result::Err(ErrorCode::ConstraintViolation, "credits_remaining < 0");
  it->second = r;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Credit transactions
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertCreditTransaction(Transaction& t, model::CreditTransactionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.accounts.contains(r.account_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown account: " + r.account_id);
  if (r.amount == 0 || r.balance_after < 0) return Result::Err(ErrorCode::ConstraintViolation, "invalid credit transaction row");

  r.seq = s.next_credit_tx_seq++;
  s.credit_transactions.push_back(r);
  return Result::Ok();
}

std::vector<model::CreditTransactionRecord> MemoryRepository::ListCreditTransactions(Transaction& t, const std::string& account_id,
                                                                                     const model::Pagination& page) {
  const auto&                                 s = TX(t).View();
  std::vector<model::CreditTransactionRecord> rows;

  for (const auto& r : s.credit_transactions) {
    if (r.account_id == account_id) rows.push_back(r);
  }

  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.seq > b.seq;
  });

  std::vector<model::CreditTransactionRecord> out;
  for (size_t i = page.offset; i < rows.size() && out.size() < page.limit; ++i) {
    out.push_back(rows[i]);
  }
  return out;
}

int64_t MemoryRepository::SumCreditTransactions(Transaction& t, const std::string& account_id) {
  const auto& s   = TX(t).View();
  int64_t     sum = 0;
  for (const auto& r : s.credit_transactions) {
    if (r.account_id == account_id) sum += r.amount;
  }
  return sum;
}

} // namespace workledger::db::memory
