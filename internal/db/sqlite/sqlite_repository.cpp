#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string_view>

#include "internal/model/codes.hpp"

namespace workledger::db::sqlite {

namespace codes = workledger::model;

namespace {

// BEGIN IMMEDIATE already holds the database write lock, so a plain
// SELECT inside the transaction is as strong as SELECT ... FOR UPDATE.
constexpr const char* kJobColumns =
    "seq,id,type,status,priority,owner_id,payload,result,error,attempts,max_attempts,"
    "created_at_ms,started_at_ms,completed_at_ms,scheduled_for_ms,heartbeat_at_ms";

constexpr const char* kAccountColumns =
    "id,credits_remaining,starting_credits,lifetime_credits_used,subscription_tier,"
    "subscription_expires_at_ms,external_subscription_ref,created_at_ms,updated_at_ms";

constexpr const char* kCreditTxColumns = "seq,id,account_id,amount,transaction_type,description,reference_id,balance_after,created_at_ms";

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

// Steps a read statement; SQLITE_ROW -> true, SQLITE_DONE -> false.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.seq              = ColU64(st, 0);
  r.id               = ColText(st, 1);
  r.type             = codes::ParseJobType(ColText(st, 2)).value_or(v1::JOB_TYPE_UNSPECIFIED);
  r.status           = codes::ParseJobStatus(ColText(st, 3)).value_or(v1::JOB_STATUS_UNSPECIFIED);
  r.priority         = sqlite3_column_int(st, 4);
  r.owner_id         = ColText(st, 5);
  r.payload          = ColText(st, 6);
  r.result           = ColOptText(st, 7);
  r.error            = ColOptText(st, 8);
  r.attempts         = static_cast<uint32_t>(sqlite3_column_int(st, 9));
  r.max_attempts     = static_cast<uint32_t>(sqlite3_column_int(st, 10));
  r.created_at_ms    = ColU64(st, 11);
  r.started_at_ms    = ColOptU64(st, 12);
  r.completed_at_ms  = ColOptU64(st, 13);
  r.scheduled_for_ms = ColU64(st, 14);
  r.heartbeat_at_ms  = ColOptU64(st, 15);
  return r;
}

model::AccountRecord ReadAccount(sqlite3_stmt* st) {
  model::AccountRecord r;
  r.id                         = ColText(st, 0);
  r.credits_remaining          = ColI64(st, 1);
  r.starting_credits           = ColI64(st, 2);
  r.lifetime_credits_used      = ColI64(st, 3);
  r.subscription_tier          = codes::ParseSubscriptionTier(ColText(st, 4));
  r.subscription_expires_at_ms = ColOptU64(st, 5);
  r.external_subscription_ref  = ColOptText(st, 6);
  r.created_at_ms              = ColU64(st, 7);
  r.updated_at_ms              = ColU64(st, 8);
  return r;
}

model::CreditTransactionRecord ReadCreditTx(sqlite3_stmt* st) {
  model::CreditTransactionRecord r;
  r.seq              = ColU64(st, 0);
  r.id               = ColText(st, 1);
  r.account_id       = ColText(st, 2);
  r.amount           = ColI64(st, 3);
  r.transaction_type = codes::ParseTransactionType(ColText(st, 4)).value_or(v1::TRANSACTION_TYPE_UNSPECIFIED);
  r.description      = ColText(st, 5);
  r.reference_id     = ColOptText(st, 6);
  r.balance_after    = ColI64(st, 7);
  r.created_at_ms    = ColU64(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (sqlite3_extended_errcode(db)) {
    case SQLITE_CONSTRAINT_PRIMARYKEY:
    case SQLITE_CONSTRAINT_UNIQUE:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO jobs(id,type,status,priority,owner_id,payload,result,error,attempts,max_attempts,"
                    "created_at_ms,started_at_ms,completed_at_ms,scheduled_for_ms,heartbeat_at_ms) "
                    "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, std::string(codes::ToString(r.type)));
  BindText(st.get(), 3, std::string(codes::ToString(r.status)));
  sqlite3_bind_int(st.get(), 4, r.priority);
  BindText(st.get(), 5, r.owner_id);
  BindText(st.get(), 6, r.payload);
  BindOptText(st.get(), 7, r.result);
  BindOptText(st.get(), 8, r.error);
  sqlite3_bind_int(st.get(), 9, static_cast<int>(r.attempts));
  sqlite3_bind_int(st.get(), 10, static_cast<int>(r.max_attempts));
  BindU64(st.get(), 11, r.created_at_ms);
  BindOptU64(st.get(), 12, r.started_at_ms);
  BindOptU64(st.get(), 13, r.completed_at_ms);
  BindU64(st.get(), 14, r.scheduled_for_ms);
  BindOptU64(st.get(), 15, r.heartbeat_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=?;");
  BindText(st.get(), 1, id);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadJob(st.get());
}

std::optional<model::JobRecord> SqliteRepository::LockJob(Transaction& t, const std::string& id) {
  return GetJob(t, id);
}

std::optional<model::JobRecord> SqliteRepository::LockNextClaimableJob(Transaction& t, const std::vector<v1::JobType>& types, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kJobColumns +
                    " FROM jobs WHERE status='pending' AND scheduled_for_ms<=? AND attempts<max_attempts";
  if (!types.empty()) {
    sql += " AND type IN (";
    for (size_t i = 0; i < types.size(); ++i) {
      sql += i ? ",?" : "?";
    }
    sql += ")";
  }
  sql += " ORDER BY priority DESC, scheduled_for_ms ASC, seq ASC LIMIT 1;";

  auto st = Prepare(db, sql);
  BindU64(st.get(), 1, now_ms);
  for (size_t i = 0; i < types.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 2), std::string(codes::ToString(types[i])));
  }

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadJob(st.get());
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE jobs SET status=?,priority=?,payload=?,result=?,error=?,attempts=?,max_attempts=?,"
                    "started_at_ms=?,completed_at_ms=?,scheduled_for_ms=?,heartbeat_at_ms=? WHERE id=?;");

  BindText(st.get(), 1, std::string(codes::ToString(r.status)));
  sqlite3_bind_int(st.get(), 2, r.priority);
  BindText(st.get(), 3, r.payload);
  BindOptText(st.get(), 4, r.result);
  BindOptText(st.get(), 5, r.error);
  sqlite3_bind_int(st.get(), 6, static_cast<int>(r.attempts));
  sqlite3_bind_int(st.get(), 7, static_cast<int>(r.max_attempts));
  BindOptU64(st.get(), 8, r.started_at_ms);
  BindOptU64(st.get(), 9, r.completed_at_ms);
  BindU64(st.get(), 10, r.scheduled_for_ms);
  BindOptU64(st.get(), 11, r.heartbeat_at_ms);
  BindText(st.get(), 12, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "job not found: " + r.id);
  return Result::Ok();
}

std::vector<model::JobRecord> SqliteRepository::ListJobsByOwner(Transaction& t, const model::JobFilter& f) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE owner_id=?";
  if (f.status) sql += " AND status=?";
  if (f.type) sql += " AND type=?";
  sql += " ORDER BY created_at_ms DESC, seq DESC LIMIT ?;";

  auto st  = Prepare(db, sql);
  int  idx = 1;
  BindText(st.get(), idx++, f.owner_id);
  if (f.status) BindText(st.get(), idx++, std::string(codes::ToString(*f.status)));
  if (f.type) BindText(st.get(), idx++, std::string(codes::ToString(*f.type)));
  BindU64(st.get(), idx, f.limit);

  std::vector<model::JobRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadJob(st.get()));
  }
  return out;
}

std::vector<model::JobRecord> SqliteRepository::LockStaleProcessingJobs(Transaction& t, uint64_t cutoff_ms, uint32_t limit) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kJobColumns +
                             " FROM jobs WHERE status='processing' AND COALESCE(heartbeat_at_ms, started_at_ms, 0) < ?"
                             " ORDER BY started_at_ms ASC, seq ASC LIMIT ?;");
  BindU64(st.get(), 1, cutoff_ms);
  BindU64(st.get(), 2, limit);

  std::vector<model::JobRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadJob(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteTerminalJobsCompletedBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM jobs WHERE status IN ('completed','failed','cancelled') AND completed_at_ms < ?;");
  BindU64(st.get(), 1, cutoff_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  deleted     = result ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
  return result;
}

std::vector<model::StatusCount> SqliteRepository::CountJobsByStatusSince(Transaction& t, uint64_t created_after_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT status, COUNT(*) FROM jobs WHERE created_at_ms > ? GROUP BY status;");
  BindU64(st.get(), 1, created_after_ms);

  std::vector<model::StatusCount> out;
  while (StepRow(db, st.get())) {
    auto status = codes::ParseJobStatus(ColText(st.get(), 0));
    if (status) out.push_back({*status, ColU64(st.get(), 1)});
  }
  return out;
}

std::vector<model::TypeStatusCount> SqliteRepository::CountActiveJobsByType(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT type, status, COUNT(*) FROM jobs WHERE status IN ('pending','processing') GROUP BY type, status;");

  std::vector<model::TypeStatusCount> out;
  while (StepRow(db, st.get())) {
    auto type   = codes::ParseJobType(ColText(st.get(), 0));
    auto status = codes::ParseJobStatus(ColText(st.get(), 1));
    if (type && status) out.push_back({*type, *status, ColU64(st.get(), 2)});
  }
  return out;
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result SqliteRepository::InsertAccount(Transaction& t, const model::AccountRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO accounts(") + kAccountColumns + ") VALUES(?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindI64(st.get(), 2, r.credits_remaining);
  BindI64(st.get(), 3, r.starting_credits);
  BindI64(st.get(), 4, r.lifetime_credits_used);
  BindText(st.get(), 5, std::string(codes::ToString(r.subscription_tier)));
  BindOptU64(st.get(), 6, r.subscription_expires_at_ms);
  BindOptText(st.get(), 7, r.external_subscription_ref);
  BindU64(st.get(), 8, r.created_at_ms);
  BindU64(st.get(), 9, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AccountRecord> SqliteRepository::GetAccount(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE id=?;");
  BindText(st.get(), 1, id);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadAccount(st.get());
}

std::optional<model::AccountRecord> SqliteRepository::LockAccount(Transaction& t, const std::string& id) {
  return GetAccount(t, id);
}

Result SqliteRepository::UpdateAccount(Transaction& t, const model::AccountRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE accounts SET credits_remaining=?,lifetime_credits_used=?,subscription_tier=?,"
                     "subscription_expires_at_ms=?,external_subscription_ref=?,updated_at_ms=? WHERE id=?;");

  BindI64(st.get(), 1, r.credits_remaining);
  BindI64(st.get(), 2, r.lifetime_credits_used);
  BindText(st.get(), 3, std::string(codes::ToString(r.subscription_tier)));
  BindOptU64(st.get(), 4, r.subscription_expires_at_ms);
  BindOptText(st.get(), 5, r.external_subscription_ref);
  BindU64(st.get(), 6, r.updated_at_ms);
  BindText(st.get(), 7, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "account not found: " + r.id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Credit transactions
// ------------------------------------------------------------------

Result SqliteRepository::InsertCreditTransaction(Transaction& t, model::CreditTransactionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO credit_transactions(id,account_id,amount,transaction_type,description,reference_id,"
                     "balance_after,created_at_ms) VALUES(?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.account_id);
  BindI64(st.get(), 3, r.amount);
  BindText(st.get(), 4, std::string(codes::ToString(r.transaction_type)));
  BindText(st.get(), 5, r.description);
  BindOptText(st.get(), 6, r.reference_id);
  BindI64(st.get(), 7, r.balance_after);
  BindU64(st.get(), 8, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::CreditTransactionRecord> SqliteRepository::ListCreditTransactions(Transaction& t, const std::string& account_id,
                                                                                     const model::Pagination& page) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kCreditTxColumns +
                             " FROM credit_transactions WHERE account_id=? ORDER BY created_at_ms DESC, seq DESC LIMIT ? OFFSET ?;");
  BindText(st.get(), 1, account_id);
  BindU64(st.get(), 2, page.limit);
  BindU64(st.get(), 3, page.offset);

  std::vector<model::CreditTransactionRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadCreditTx(st.get()));
  }
  return out;
}

int64_t SqliteRepository::SumCreditTransactions(Transaction& t, const std::string& account_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COALESCE(SUM(amount), 0) FROM credit_transactions WHERE account_id=?;");
  BindText(st.get(), 1, account_id);

  if (!StepRow(db, st.get())) return 0;
  return ColI64(st.get(), 0);
}

} // namespace workledger::db::sqlite
