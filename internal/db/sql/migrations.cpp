#include "migrations.hpp"

namespace workledger::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& stmt : ordered_sql) {
    executor.ExecuteSQL(stmt);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS accounts ("
      " id TEXT PRIMARY KEY,"
      " credits_remaining INTEGER NOT NULL DEFAULT 100 CHECK (credits_remaining >= 0),"
      " starting_credits INTEGER NOT NULL DEFAULT 0,"
      " lifetime_credits_used INTEGER NOT NULL DEFAULT 0,"
      " subscription_tier TEXT NOT NULL DEFAULT 'free' CHECK (subscription_tier IN ('free','pro','enterprise')),"
      " subscription_expires_at_ms INTEGER,"
      " external_subscription_ref TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS jobs ("
      " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
      " id TEXT NOT NULL UNIQUE,"
      " type TEXT NOT NULL,"
      " status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','processing','completed','failed','cancelled')),"
      " priority INTEGER NOT NULL DEFAULT 5,"
      " owner_id TEXT NOT NULL REFERENCES accounts(id) ON DELETE CASCADE,"
      " payload TEXT NOT NULL,"
      " result TEXT,"
      " error TEXT,"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " max_attempts INTEGER NOT NULL DEFAULT 3,"
      " created_at_ms INTEGER NOT NULL,"
      " started_at_ms INTEGER,"
      " completed_at_ms INTEGER,"
      " scheduled_for_ms INTEGER NOT NULL,"
      " heartbeat_at_ms INTEGER);",

      "CREATE INDEX IF NOT EXISTS idx_jobs_claim ON jobs (priority DESC, scheduled_for_ms ASC, seq ASC) WHERE status = 'pending';",
      "CREATE INDEX IF NOT EXISTS idx_jobs_owner_status ON jobs (owner_id, status, created_at_ms DESC);",
      "CREATE INDEX IF NOT EXISTS idx_jobs_type_status ON jobs (type, status);",
      "CREATE INDEX IF NOT EXISTS idx_jobs_status_started ON jobs (status, started_at_ms);",

      "CREATE TABLE IF NOT EXISTS credit_transactions ("
      " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
      " id TEXT NOT NULL UNIQUE,"
      " account_id TEXT NOT NULL REFERENCES accounts(id) ON DELETE CASCADE,"
      " amount INTEGER NOT NULL CHECK (amount <> 0),"
      " transaction_type TEXT NOT NULL CHECK (transaction_type IN ('purchase','subscription','generation','refund','bonus','adjustment')),"
      " description TEXT NOT NULL,"
      " reference_id TEXT,"
      " balance_after INTEGER NOT NULL CHECK (balance_after >= 0),"
      " created_at_ms INTEGER NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_credit_tx_account ON credit_transactions (account_id);",
      "CREATE INDEX IF NOT EXISTS idx_credit_tx_created ON credit_transactions (created_at_ms DESC);",
      "CREATE INDEX IF NOT EXISTS idx_credit_tx_reference ON credit_transactions (reference_id);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS accounts ("
      " id TEXT PRIMARY KEY,"
      " credits_remaining BIGINT NOT NULL DEFAULT 100 CHECK (credits_remaining >= 0),"
      " starting_credits BIGINT NOT NULL DEFAULT 0,"
      " lifetime_credits_used BIGINT NOT NULL DEFAULT 0,"
      " subscription_tier TEXT NOT NULL DEFAULT 'free' CHECK (subscription_tier IN ('free','pro','enterprise')),"
      " subscription_expires_at_ms BIGINT,"
      " external_subscription_ref TEXT,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS jobs ("
      " seq BIGSERIAL PRIMARY KEY,"
      " id TEXT NOT NULL UNIQUE,"
      " type TEXT NOT NULL,"
      " status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','processing','completed','failed','cancelled')),"
      " priority INTEGER NOT NULL DEFAULT 5,"
      " owner_id TEXT NOT NULL REFERENCES accounts(id) ON DELETE CASCADE,"
      " payload JSONB NOT NULL,"
      " result JSONB,"
      " error TEXT,"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " max_attempts INTEGER NOT NULL DEFAULT 3,"
      " created_at_ms BIGINT NOT NULL,"
      " started_at_ms BIGINT,"
      " completed_at_ms BIGINT,"
      " scheduled_for_ms BIGINT NOT NULL,"
      " heartbeat_at_ms BIGINT);",

      "CREATE INDEX IF NOT EXISTS idx_jobs_claim ON jobs (priority DESC, scheduled_for_ms ASC, seq ASC) WHERE status = 'pending';",
      "CREATE INDEX IF NOT EXISTS idx_jobs_owner_status ON jobs (owner_id, status, created_at_ms DESC);",
      "CREATE INDEX IF NOT EXISTS idx_jobs_type_status ON jobs (type, status);",
      "CREATE INDEX IF NOT EXISTS idx_jobs_status_started ON jobs (status, started_at_ms);",

      "CREATE TABLE IF NOT EXISTS credit_transactions ("
      " seq BIGSERIAL PRIMARY KEY,"
      " id TEXT NOT NULL UNIQUE,"
      " account_id TEXT NOT NULL REFERENCES accounts(id) ON DELETE CASCADE,"
      " amount BIGINT NOT NULL CHECK (amount <> 0),"
      " transaction_type TEXT NOT NULL CHECK (transaction_type IN ('purchase','subscription','generation','refund','bonus','adjustment')),"
      " description TEXT NOT NULL,"
      " reference_id TEXT,"
      " balance_after BIGINT NOT NULL CHECK (balance_after >= 0),"
      " created_at_ms BIGINT NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_credit_tx_account ON credit_transactions (account_id);",
      "CREATE INDEX IF NOT EXISTS idx_credit_tx_created ON credit_transactions (created_at_ms DESC);",
      "CREATE INDEX IF NOT EXISTS idx_credit_tx_reference ON credit_transactions (reference_id);"};
  return kSchema;
}

} // namespace workledger::db::sql
