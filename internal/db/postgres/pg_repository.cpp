#include "pg_repository.hpp"

#include "internal/model/codes.hpp"

namespace workledger::db::postgres {

namespace codes = workledger::model;

namespace {

constexpr const char* kJobColumns =
    "seq,id,type,status,priority,owner_id,payload::text,result::text,error,attempts,max_attempts,"
    "created_at_ms,started_at_ms,completed_at_ms,scheduled_for_ms,heartbeat_at_ms";

constexpr const char* kCreditTxColumns = "seq,id,account_id,amount,transaction_type,description,reference_id,balance_after,created_at_ms";

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

std::optional<int64_t> AsParam(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.seq              = row[0].as<uint64_t>();
  r.id               = row[1].c_str();
  r.type             = codes::ParseJobType(row[2].c_str()).value_or(v1::JOB_TYPE_UNSPECIFIED);
  r.status           = codes::ParseJobStatus(row[3].c_str()).value_or(v1::JOB_STATUS_UNSPECIFIED);
  r.priority         = row[4].as<int32_t>();
  r.owner_id         = row[5].c_str();
  r.payload          = row[6].c_str();
  r.result           = OptText(row[7]);
  r.error            = OptText(row[8]);
  r.attempts         = row[9].as<uint32_t>();
  r.max_attempts     = row[10].as<uint32_t>();
  r.created_at_ms    = row[11].as<uint64_t>();
  r.started_at_ms    = OptU64(row[12]);
  r.completed_at_ms  = OptU64(row[13]);
  r.scheduled_for_ms = row[14].as<uint64_t>();
  r.heartbeat_at_ms  = OptU64(row[15]);
  return r;
}

model::AccountRecord ReadAccount(const pqxx::row& row) {
  model::AccountRecord r;
  r.id                         = row[0].c_str();
  r.credits_remaining          = row[1].as<int64_t>();
  r.starting_credits           = row[2].as<int64_t>();
  r.lifetime_credits_used      = row[3].as<int64_t>();
  r.subscription_tier          = codes::ParseSubscriptionTier(row[4].c_str());
  r.subscription_expires_at_ms = OptU64(row[5]);
  r.external_subscription_ref  = OptText(row[6]);
  r.created_at_ms              = row[7].as<uint64_t>();
  r.updated_at_ms              = row[8].as<uint64_t>();
  return r;
}

model::CreditTransactionRecord ReadCreditTx(const pqxx::row& row) {
  model::CreditTransactionRecord r;
  r.seq              = row[0].as<uint64_t>();
  r.id               = row[1].c_str();
  r.account_id       = row[2].c_str();
  r.amount           = row[3].as<int64_t>();
  r.transaction_type = codes::ParseTransactionType(row[4].c_str()).value_or(v1::TRANSACTION_TYPE_UNSPECIFIED);
  r.description      = row[5].c_str();
  r.reference_id     = OptText(row[6]);
  r.balance_after    = row[7].as<int64_t>();
  r.created_at_ms    = row[8].as<uint64_t>();
  return r;
}

template <typename Row, typename Reader>
auto ReadAll(const pqxx::result& res, Reader reader) {
  std::vector<Row> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(reader(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  try {
    auto row = TX(t).Work().exec_params1(
        "INSERT INTO jobs(id,type,status,priority,owner_id,payload,result,error,attempts,max_attempts,"
        "created_at_ms,started_at_ms,completed_at_ms,scheduled_for_ms,heartbeat_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7::jsonb,$8,$9,$10,$11,$12,$13,$14,$15) RETURNING seq;",
        r.id, std::string(codes::ToString(r.type)), std::string(codes::ToString(r.status)), r.priority, r.owner_id, r.payload, r.result,
        r.error, static_cast<int32_t>(r.attempts), static_cast<int32_t>(r.max_attempts), static_cast<int64_t>(r.created_at_ms),
        AsParam(r.started_at_ms), AsParam(r.completed_at_ms), static_cast<int64_t>(r.scheduled_for_ms), AsParam(r.heartbeat_at_ms));
    r.seq = row[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::optional<model::JobRecord> PgRepository::LockJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("lock_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::optional<model::JobRecord> PgRepository::LockNextClaimableJob(Transaction& t, const std::vector<v1::JobType>& types, uint64_t now_ms) {
  pqxx::params params;
  params.append(static_cast<int64_t>(now_ms));

  std::string sql = std::string("SELECT ") + kJobColumns +
                    " FROM jobs WHERE status='pending' AND scheduled_for_ms<=$1 AND attempts<max_attempts";
  if (!types.empty()) {
    sql += " AND type IN (";
    for (size_t i = 0; i < types.size(); ++i) {
      if (i) sql += ",";
      sql += "$" + std::to_string(i + 2);
      params.append(std::string(codes::ToString(types[i])));
    }
    sql += ")";
  }
  sql += " ORDER BY priority DESC, scheduled_for_ms ASC, seq ASC LIMIT 1 FOR UPDATE SKIP LOCKED;";

  auto res = TX(t).Work().exec_params(sql, params);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job", r.id, std::string(codes::ToString(r.status)), r.priority, r.payload, r.result, r.error,
                                          static_cast<int32_t>(r.attempts), static_cast<int32_t>(r.max_attempts), AsParam(r.started_at_ms),
                                          AsParam(r.completed_at_ms), static_cast<int64_t>(r.scheduled_for_ms), AsParam(r.heartbeat_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "job not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobRecord> PgRepository::ListJobsByOwner(Transaction& t, const model::JobFilter& f) {
  pqxx::params params;
  params.append(f.owner_id);

  std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE owner_id=$1";
  if (f.status) {
    params.append(std::string(codes::ToString(*f.status)));
    sql += " AND status=$" + std::to_string(params.size());
  }
  if (f.type) {
    params.append(std::string(codes::ToString(*f.type)));
    sql += " AND type=$" + std::to_string(params.size());
  }
  params.append(static_cast<int64_t>(f.limit));
  sql += " ORDER BY created_at_ms DESC, seq DESC LIMIT $" + std::to_string(params.size()) + ";";

  return ReadAll<model::JobRecord>(TX(t).Work().exec_params(sql, params), ReadJob);
}

std::vector<model::JobRecord> PgRepository::LockStaleProcessingJobs(Transaction& t, uint64_t cutoff_ms, uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns +
                                          " FROM jobs WHERE status='processing' AND COALESCE(heartbeat_at_ms, started_at_ms, 0) < $1"
                                          " ORDER BY started_at_ms ASC, seq ASC LIMIT $2 FOR UPDATE SKIP LOCKED;",
                                      static_cast<int64_t>(cutoff_ms), static_cast<int64_t>(limit));
  return ReadAll<model::JobRecord>(res, ReadJob);
}

Result PgRepository::DeleteTerminalJobsCompletedBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM jobs WHERE status IN ('completed','failed','cancelled') AND completed_at_ms < $1;",
                                        static_cast<int64_t>(cutoff_ms));
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    deleted = 0;
    return Translate(e);
  }
}

std::vector<model::StatusCount> PgRepository::CountJobsByStatusSince(Transaction& t, uint64_t created_after_ms) {
  auto res = TX(t).Work().exec_params("SELECT status, COUNT(*) FROM jobs WHERE created_at_ms > $1 GROUP BY status;", static_cast<int64_t>(created_after_ms));

  std::vector<model::StatusCount> out;
  for (const auto& row : res) {
    auto status = codes::ParseJobStatus(row[0].c_str());
    if (status) out.push_back({*status, row[1].as<uint64_t>()});
  }
  return out;
}

std::vector<model::TypeStatusCount> PgRepository::CountActiveJobsByType(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT type, status, COUNT(*) FROM jobs WHERE status IN ('pending','processing') GROUP BY type, status;");

  std::vector<model::TypeStatusCount> out;
  for (const auto& row : res) {
    auto type   = codes::ParseJobType(row[0].c_str());
    auto status = codes::ParseJobStatus(row[1].c_str());
    if (type && status) out.push_back({*type, *status, row[2].as<uint64_t>()});
  }
  return out;
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result PgRepository::InsertAccount(Transaction& t, const model::AccountRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO accounts(id,credits_remaining,starting_credits,lifetime_credits_used,subscription_tier,"
        "subscription_expires_at_ms,external_subscription_ref,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);",
        r.id, r.credits_remaining, r.starting_credits, r.lifetime_credits_used, std::string(codes::ToString(r.subscription_tier)),
        AsParam(r.subscription_expires_at_ms), r.external_subscription_ref, static_cast<int64_t>(r.created_at_ms),
        static_cast<int64_t>(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AccountRecord> PgRepository::GetAccount(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_account", id);
  if (res.empty()) return std::nullopt;
  return ReadAccount(res[0]);
}

std::optional<model::AccountRecord> PgRepository::LockAccount(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("lock_account", id);
  if (res.empty()) return std::nullopt;
  return ReadAccount(res[0]);
}

Result PgRepository::UpdateAccount(Transaction& t, const model::AccountRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_account", r.id, r.credits_remaining, r.lifetime_credits_used,
                                          std::string(codes::ToString(r.subscription_tier)), AsParam(r.subscription_expires_at_ms),
                                          r.external_subscription_ref, static_cast<int64_t>(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "account not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Credit transactions
// ------------------------------------------------------------------

Result PgRepository::InsertCreditTransaction(Transaction& t, model::CreditTransactionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_credit_tx", r.id, r.account_id, r.amount, std::string(codes::ToString(r.transaction_type)),
                                          r.description, r.reference_id, r.balance_after, static_cast<int64_t>(r.created_at_ms));
    r.seq    = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CreditTransactionRecord> PgRepository::ListCreditTransactions(Transaction& t, const std::string& account_id,
                                                                                 const model::Pagination& page) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kCreditTxColumns +
                                          " FROM credit_transactions WHERE account_id=$1 ORDER BY created_at_ms DESC, seq DESC LIMIT $2 OFFSET $3;",
                                      account_id, static_cast<int64_t>(page.limit), static_cast<int64_t>(page.offset));
  return ReadAll<model::CreditTransactionRecord>(res, ReadCreditTx);
}

int64_t PgRepository::SumCreditTransactions(Transaction& t, const std::string& account_id) {
  auto row = TX(t).Work().exec_params1("SELECT COALESCE(SUM(amount), 0)::bigint FROM credit_transactions WHERE account_id=$1;", account_id);
  return row[0].as<int64_t>();
}

} // namespace workledger::db::postgres
