#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace workledger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!lock_.owns_lock()) return;

  int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    WORKLEDGER_LOG_WARN("sqlite rollback failed", {observability::StringField("db", db_->Path()),
                                                   observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::Commit() {
  if (!lock_.owns_lock()) throw std::logic_error("sqlite transaction already finished");
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (!lock_.owns_lock()) return;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace workledger::db::sqlite
