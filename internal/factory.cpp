#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if WORKLEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if WORKLEDGER_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace workledger::factory {

using observability::StringField;

namespace {

#if WORKLEDGER_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if WORKLEDGER_DB_POSTGRES
// All statements run in one transaction so a half-applied schema never commits.
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const workledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WORKLEDGER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());

    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());

    WORKLEDGER_LOG_INFO("repository ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if WORKLEDGER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 8u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);

      PostgresMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      tx.commit();
    }

    WORKLEDGER_LOG_INFO("repository ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  WORKLEDGER_LOG_WARN("repository ready", {StringField("backend", "memory"), StringField("note", "state is lost on restart")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const workledger::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::JobQueueOptions queue_options;
  if (config.job_queue().default_max_attempts() > 0) {
    queue_options.default_max_attempts = config.job_queue().default_max_attempts();
  }
  app.jobs = std::make_shared<core::JobQueue>(app.repository, queue_options);

  core::LedgerOptions ledger_options;
  if (config.ledger().has_default_starting_credits()) {
    ledger_options.default_starting_credits = config.ledger().default_starting_credits();
  }
  app.ledger = std::make_shared<core::CreditsLedger>(app.repository, ledger_options);

  // ------------------------------------------------------------------
  // Reaper
  // ------------------------------------------------------------------
  const auto& reaper_config = config.reaper();

  reaper::ReaperOptions reaper_options;
  if (reaper_config.has_interval()) reaper_options.interval = util::FromProto(reaper_config.interval());
  if (reaper_config.has_processing_timeout()) reaper_options.processing_timeout = util::FromProto(reaper_config.processing_timeout());
  if (reaper_config.batch_limit() > 0) reaper_options.batch_limit = reaper_config.batch_limit();
  reaper_options.retention_days = reaper_config.retention_days();

  if (reaper_config.enabled()) {
    app.reaper = std::make_shared<reaper::JobReaper>(app.jobs, reaper_options);
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.jobs                         = app.jobs;
  ctx.ledger                       = app.ledger;
  ctx.defaults.processing_timeout  = reaper_options.processing_timeout;
  ctx.defaults.requeue_batch_limit = reaper_options.batch_limit;
  if (config.job_queue().cleanup_older_than_days() > 0) {
    ctx.defaults.cleanup_older_than_days = config.job_queue().cleanup_older_than_days();
  }
  if (config.job_queue().has_retry_backoff()) {
    ctx.defaults.retry_backoff = util::FromProto(config.job_queue().retry_backoff());
  }

  auto job_service    = std::make_shared<service::JobService>(ctx);
  auto ledger_service = std::make_shared<service::LedgerService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::JobServer>(job_service));
  app.grpc_services.push_back(std::make_unique<grpc::LedgerServer>(ledger_service));

  return app;
}

} // namespace workledger::factory
