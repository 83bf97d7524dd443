#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/credits_ledger.hpp"
#include "internal/core/job_queue.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_clock.hpp"

#if WORKLEDGER_DB_POSTGRES
#include <pqxx/pqxx>
#endif

namespace {

using namespace std::chrono_literals;
using namespace workledger::v1;
using workledger::core::CreditsLedger;
using workledger::core::JobQueue;
using workledger::core::NewJob;
using workledger::db::ErrorCode;
using workledger::db::Repository;
using workledger::testing::ManualClock;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

NewJob MakeJob(const std::string& owner, JobType type = JOB_TYPE_IMAGE_GENERATION, JobPriority priority = JOB_PRIORITY_NORMAL) {
  NewJob job;
  job.type     = type;
  job.owner_id = owner;
  job.priority = priority;

  auto& fields = *job.payload.mutable_fields();
  fields["prompt"].set_string_value("neon city, \"quoted\" \\ backslash, unicode ☃");
  fields["steps"].set_number_value(30);
  fields["upscale"].set_bool_value(true);
  (*fields["size"].mutable_struct_value()->mutable_fields())["width"].set_number_value(1024);
  fields["tags"].mutable_list_value()->add_values()->set_string_value("night");
  return job;
}

// One failing statement per transaction: Postgres aborts the whole
// transaction after the first error.
void VerifyRepositoryResultCodes(Repository& repo, const std::string& prefix) {
  workledger::db::model::AccountRecord account;
  account.id                = prefix + "-acct";
  account.credits_remaining = 10;
  account.starting_credits  = 10;
  account.created_at_ms     = NowMs();
  account.updated_at_ms     = account.created_at_ms;
  {
    auto tx = repo.Begin();
    assert(repo.InsertAccount(*tx, account));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertAccount(*tx, account).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    workledger::db::model::JobRecord orphan;
    orphan.id               = prefix + "-orphan";
    orphan.type             = JOB_TYPE_IMAGE_GENERATION;
    orphan.owner_id         = prefix + "-nobody";
    orphan.created_at_ms    = NowMs();
    orphan.scheduled_for_ms = orphan.created_at_ms;

    auto tx = repo.Begin();
    assert(!repo.InsertJob(*tx, orphan));
    tx->Rollback();
  }
  {
    workledger::db::model::JobRecord missing;
    missing.id       = prefix + "-missing";
    missing.owner_id = account.id;
    missing.type     = JOB_TYPE_IMAGE_GENERATION;

    auto tx = repo.Begin();
    assert(repo.UpdateJob(*tx, missing).code == ErrorCode::NotFound);
    tx->Rollback();
  }
  {
    auto overdrawn              = account;
    overdrawn.credits_remaining = -1;

    auto tx = repo.Begin();
    assert(!repo.UpdateAccount(*tx, overdrawn));
    tx->Rollback();
  }

  auto check  = repo.Begin();
  auto stored = repo.GetAccount(*check, account.id);
  check->Commit();
  assert(stored.has_value());
  assert(stored->credits_remaining == 10);
}

void VerifyRollbackOnDestruction(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();

    workledger::db::model::AccountRecord account;
    account.id                = prefix + "-ghost";
    account.credits_remaining = 1;
    account.starting_credits  = 1;
    assert(repo.InsertAccount(*tx, account));
    // no commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetAccount(*tx, prefix + "-ghost").has_value());
  tx->Commit();
}

void VerifyJobLifecycle(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  ManualClock   clock;
  CreditsLedger ledger(repo, {}, clock.Fn());
  JobQueue      queue(repo, {}, clock.Fn());

  const auto owner = prefix + "-jobs-owner";
  ledger.OpenAccount(owner);

  auto low    = queue.Create(MakeJob(owner, JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_LOW));
  auto high_a = queue.Create(MakeJob(owner, JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_HIGH));
  auto high_b = queue.Create(MakeJob(owner, JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_HIGH));

  auto later_job          = MakeJob(owner, JOB_TYPE_VIDEO_GENERATION, JOB_PRIORITY_URGENT);
  later_job.scheduled_for = clock.Now() + 5min;
  auto later               = queue.Create(later_job);

  // payload survives the store byte-for-byte in meaning
  auto fetched = queue.Get(low.id().value());
  assert(fetched.payload().fields().at("prompt").string_value() == "neon city, \"quoted\" \\ backslash, unicode ☃");
  assert(fetched.payload().fields().at("steps").number_value() == 30);
  assert(fetched.payload().fields().at("size").struct_value().fields().at("width").number_value() == 1024);
  assert(fetched.payload().fields().at("tags").list_value().values(0).string_value() == "night");

  auto first = queue.Claim();
  assert(first->id().value() == high_a.id().value());
  assert(first->attempts() == 1);
  assert(queue.Claim()->id().value() == high_b.id().value());
  assert(!queue.Claim({JOB_TYPE_VIDEO_GENERATION}).has_value());

  google::protobuf::Struct result;
  (*result.mutable_fields())["url"].set_string_value("s3://bucket/out.png");
  assert(queue.Complete(high_a.id().value(), result));
  assert(queue.Get(high_a.id().value()).result().fields().at("url").string_value() == "s3://bucket/out.png");

  auto retried = queue.Fail(high_b.id().value(), "transient", true, 1min);
  assert(retried.status() == JOB_STATUS_PENDING);
  assert(retried.error() == "transient");

  clock.Advance(5min);
  assert(queue.Claim()->id().value() == later.id().value());
  assert(queue.Claim()->id().value() == high_b.id().value());
  assert(queue.Claim()->id().value() == low.id().value());
  assert(!queue.Claim().has_value());

  assert(queue.Heartbeat(low.id().value()));
  clock.Advance(20min);
  assert(queue.Heartbeat(later.id().value()));
  assert(queue.RequeueStale(15min, 10) == 2);
  assert(queue.Get(low.id().value()).status() == JOB_STATUS_PENDING);
  assert(queue.Get(high_b.id().value()).status() == JOB_STATUS_PENDING);
  assert(queue.Get(later.id().value()).status() == JOB_STATUS_PROCESSING);

  assert(queue.Cancel(later.id().value()));
  assert(!queue.Complete(later.id().value(), result));

  auto stats = queue.Stats();
  assert(stats.last_24h().completed() == 1);
  assert(stats.last_24h().cancelled() == 1);
  assert(stats.last_24h().pending() == 2);

  auto listed = queue.ListForOwner(owner, JOB_STATUS_PENDING);
  assert(listed.size() == 2);
  assert(queue.ListForOwner(owner, std::nullopt, JOB_TYPE_VIDEO_GENERATION).size() == 1);

  clock.Advance(std::chrono::hours(24 * 31));
  assert(queue.Cleanup(30) == 2);
  assert(queue.ListForOwner(owner).size() == 2);
}

void VerifyLedger(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  ManualClock   clock;
  CreditsLedger ledger(repo, {}, clock.Fn());

  const auto id = prefix + "-ledger";
  ledger.OpenAccount(id, 40);

  ledger.Debit(id, 15, "generation", std::string("job-1"));
  clock.Advance(1s);
  ledger.Credit(id, 100, TRANSACTION_TYPE_PURCHASE, "pack");
  ledger.Debit(id, 5, "correction", std::nullopt, TRANSACTION_TYPE_ADJUSTMENT);

  bool rejected = false;
  try {
    ledger.Debit(id, 1000, "too much");
  } catch (const workledger::util::InsufficientCredits& e) {
    rejected = e.Available() == 120;
  }
  assert(rejected);

  auto balance = ledger.GetBalance(id);
  assert(balance.credits_remaining() == 120);
  assert(balance.lifetime_credits_used() == 20);

  auto history = ledger.ListTransactions(id, 10);
  assert(history.size() == 3);
  assert(history[0].description() == "correction");
  assert(history[1].description() == "pack");
  assert(history[2].reference_id() == "job-1");
  assert(history[2].balance_after() == 25);

  auto granted = ledger.GrantSubscription(id, SUBSCRIPTION_TIER_ENTERPRISE, GRANT_DURATION_YEARLY);
  assert(granted.credits.credits_remaining() == 2120);
  assert(granted.credits.subscription_tier() == SUBSCRIPTION_TIER_ENTERPRISE);

  auto r = ledger.Reconcile(id);
  assert(r.consistent);
  assert(r.derived == 2120);
}

void VerifyConcurrentClaims(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  CreditsLedger ledger(repo);
  JobQueue      queue(repo);

  const auto owner = prefix + "-race-owner";
  ledger.OpenAccount(owner);
  constexpr int kJobs = 40;
  for (int i = 0; i < kJobs; ++i) queue.Create(MakeJob(owner, JOB_TYPE_STORY_EXPANSION));

  std::mutex            mutex;
  std::set<std::string> seen;
  bool                  duplicate = false;

  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&] {
      while (auto job = queue.Claim({JOB_TYPE_STORY_EXPANSION})) {
        std::lock_guard lock(mutex);
        if (!seen.insert(job->id().value()).second) duplicate = true;
      }
    });
  }
  for (auto& t : workers) t.join();

  assert(!duplicate);
  assert(seen.size() == static_cast<size_t>(kJobs));

  std::vector<std::thread> spenders;
  for (int w = 0; w < 4; ++w) {
    spenders.emplace_back([&] {
      for (int i = 0; i < 40; ++i) {
        try {
          ledger.Debit(owner, 1, "race");
        } catch (const workledger::util::InsufficientCredits&) {
        }
      }
    });
  }
  for (auto& t : spenders) t.join();

  assert(ledger.GetBalance(owner).credits_remaining() == 0);
  assert(ledger.Reconcile(owner).consistent);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) return;

  auto repo = backend.make_repository();
  std::string job_id;
  {
    CreditsLedger ledger(repo);
    JobQueue      queue(repo);
    ledger.OpenAccount(prefix + "-durable", 10);
    ledger.Debit(prefix + "-durable", 4, "before restart");
    job_id = queue.Create(MakeJob(prefix + "-durable")).id().value();
  }

  backend.restart(repo);

  CreditsLedger ledger(repo);
  JobQueue      queue(repo);
  assert(ledger.GetBalance(prefix + "-durable").credits_remaining() == 6);
  assert(ledger.ListTransactions(prefix + "-durable").size() == 1);
  assert(queue.Get(job_id).status() == JOB_STATUS_PENDING);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<workledger::db::memory::MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if WORKLEDGER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("workledger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    workledger::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
    return workledger::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if WORKLEDGER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("WORKLEDGER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("WORKLEDGER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    workledger::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(8);
    return workledger::factory::BuildRepository(config);
  };

  // claims are global; start from empty tables
  make_repo();
  {
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    tx.exec("TRUNCATE credit_transactions, jobs, accounts");
    tx.commit();
  }

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyRepositoryResultCodes(*repo, backend.name + "-codes");
  VerifyRollbackOnDestruction(*repo, backend.name + "-rollback");
  VerifyJobLifecycle(repo, backend.name);
  VerifyLedger(repo, backend.name);
  VerifyConcurrentClaims(repo, backend.name);

  repo.reset();
  VerifyRestartDurability(backend, backend.name);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if WORKLEDGER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if WORKLEDGER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "workledger_integration_repository_parity: pass\n";
  return 0;
}
