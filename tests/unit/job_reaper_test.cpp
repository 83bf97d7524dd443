#include "internal/reaper/job_reaper.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/core/credits_ledger.hpp"
#include "internal/core/job_queue.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "tests/support/test_clock.hpp"

namespace {

using namespace std::chrono_literals;
using namespace workledger::v1;
using workledger::core::JobQueue;
using workledger::reaper::JobReaper;
using workledger::reaper::ReaperOptions;
using workledger::testing::ManualClock;

struct Fixture {
  ManualClock                                               clock;
  std::shared_ptr<workledger::db::memory::MemoryRepository> repo  = std::make_shared<workledger::db::memory::MemoryRepository>();
  std::shared_ptr<JobQueue>                                 queue = std::make_shared<JobQueue>(repo, workledger::core::JobQueueOptions{}, clock.Fn());

  Fixture() {
    workledger::core::CreditsLedger(repo).OpenAccount("owner");
  }

  std::string Submit() {
    workledger::core::NewJob job;
    job.type     = JOB_TYPE_IMAGE_GENERATION;
    job.owner_id = "owner";
    return queue->Create(job).id().value();
  }
};

void TestRunOnceRequeuesStaleAndCleansUp() {
  Fixture f;

  ReaperOptions options;
  options.processing_timeout = 15min;
  options.retention_days     = 7;
  JobReaper reaper(f.queue, options);

  auto finished = f.Submit();
  f.queue->Claim();
  f.queue->Complete(finished, {});

  f.clock.Advance(std::chrono::hours(24 * 8));
  auto stuck = f.Submit();
  f.queue->Claim();

  auto idle = reaper.RunOnce();
  assert(idle.requeued == 0);
  assert(idle.deleted == 1);

  f.clock.Advance(16min);
  auto pass = reaper.RunOnce();
  assert(pass.requeued == 1);
  assert(pass.deleted == 0);
  assert(f.queue->Get(stuck).status() == JOB_STATUS_PENDING);
}

void TestZeroRetentionKeepsTerminalJobs() {
  Fixture f;
  JobReaper reaper(f.queue, ReaperOptions{});

  auto done = f.Submit();
  f.queue->Claim();
  f.queue->Complete(done, {});
  f.clock.Advance(std::chrono::hours(24 * 365));

  assert(reaper.RunOnce().deleted == 0);
  assert(f.queue->Get(done).status() == JOB_STATUS_COMPLETED);
}

void TestBackgroundLoopStartsAndStopsPromptly() {
  Fixture f;

  ReaperOptions options;
  options.interval           = 10ms;
  options.processing_timeout = 1min;
  JobReaper reaper(f.queue, options);

  auto stuck = f.Submit();
  f.queue->Claim();
  f.clock.Advance(2min);

  reaper.Start();
  assert(reaper.Running());
  for (int i = 0; i < 200 && f.queue->Get(stuck).status() != JOB_STATUS_PENDING; ++i) {
    std::this_thread::sleep_for(5ms);
  }
  assert(f.queue->Get(stuck).status() == JOB_STATUS_PENDING);

  const auto before = std::chrono::steady_clock::now();
  reaper.Stop();
  assert(!reaper.Running());
  assert(std::chrono::steady_clock::now() - before < 1s);

  // idempotent
  reaper.Stop();
}

void TestRejectsBadOptions() {
  Fixture       f;
  ReaperOptions options;
  options.interval = 0ms;

  bool threw = false;
  try {
    JobReaper reaper(f.queue, options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRunOnceRequeuesStaleAndCleansUp();
  TestZeroRetentionKeepsTerminalJobs();
  TestBackgroundLoopStartsAndStopsPromptly();
  TestRejectsBadOptions();

  std::cout << "workledger_unit_job_reaper: pass\n";
  return 0;
}
