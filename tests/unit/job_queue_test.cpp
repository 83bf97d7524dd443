#include "internal/core/job_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/credits_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_clock.hpp"

namespace {

using namespace std::chrono_literals;
using namespace workledger::v1;
using workledger::core::CreditsLedger;
using workledger::core::JobQueue;
using workledger::core::NewJob;
using workledger::testing::ManualClock;

struct Fixture {
  ManualClock                                               clock;
  std::shared_ptr<workledger::db::memory::MemoryRepository> repo = std::make_shared<workledger::db::memory::MemoryRepository>();
  JobQueue                                                  queue{repo, {}, clock.Fn()};
  CreditsLedger                                             ledger{repo, {}, clock.Fn()};

  Fixture() {
    ledger.OpenAccount("owner-1");
    ledger.OpenAccount("owner-2");
  }
};

NewJob MakeJob(JobType type = JOB_TYPE_IMAGE_GENERATION, JobPriority priority = JOB_PRIORITY_NORMAL, const std::string& owner = "owner-1") {
  NewJob job;
  job.type     = type;
  job.owner_id = owner;
  job.priority = priority;
  (*job.payload.mutable_fields())["prompt"].set_string_value("a lighthouse at dusk");
  return job;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestCreateStoresPendingJobWithDefaults() {
  Fixture f;
  auto    job = f.queue.Create(MakeJob());

  assert(!job.id().value().empty());
  assert(job.status() == JOB_STATUS_PENDING);
  assert(job.priority() == JOB_PRIORITY_NORMAL);
  assert(job.attempts() == 0);
  assert(job.max_attempts() == 3);
  assert(!job.has_started_at());
  assert(!job.has_completed_at());
  assert(job.scheduled_for().seconds() == job.created_at().seconds());
  assert(job.payload().fields().at("prompt").string_value() == "a lighthouse at dusk");

  auto fetched = f.queue.Get(job.id().value());
  assert(fetched.id().value() == job.id().value());
  assert(fetched.payload().fields().at("prompt").string_value() == "a lighthouse at dusk");
}

void TestCreateValidation() {
  Fixture f;

  assert(Throws<workledger::util::InvalidArgument>([&] { f.queue.Create(MakeJob(JOB_TYPE_UNSPECIFIED)); }));
  assert(Throws<workledger::util::InvalidArgument>([&] { f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_NORMAL, "ghost")); }));

  auto zero         = MakeJob();
  zero.max_attempts = 0;
  assert(Throws<workledger::util::InvalidArgument>([&] { f.queue.Create(zero); }));

  auto too_many         = MakeJob();
  too_many.max_attempts = 101;
  assert(Throws<workledger::util::InvalidArgument>([&] { f.queue.Create(too_many); }));

  auto boundary         = MakeJob();
  boundary.max_attempts = 100;
  assert(f.queue.Create(boundary).max_attempts() == 100);

  assert(f.queue.ListForOwner("owner-1").size() == 1);
}

void TestClaimOrdersByPriorityThenScheduleThenInsertion() {
  Fixture f;

  auto low    = f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_LOW));
  auto first  = f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_HIGH));
  auto second = f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_HIGH));
  auto urgent = f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_URGENT));

  assert(f.queue.Claim()->id().value() == urgent.id().value());
  assert(f.queue.Claim()->id().value() == first.id().value());
  assert(f.queue.Claim()->id().value() == second.id().value());

  auto last = f.queue.Claim();
  assert(last->id().value() == low.id().value());
  assert(last->status() == JOB_STATUS_PROCESSING);
  assert(last->attempts() == 1);
  assert(last->has_started_at());

  assert(!f.queue.Claim().has_value());
}

void TestClaimSkipsFutureJobsAndFiltersByType() {
  Fixture f;

  auto later          = MakeJob(JOB_TYPE_VIDEO_GENERATION, JOB_PRIORITY_URGENT);
  later.scheduled_for = f.clock.Now() + 10min;
  auto delayed        = f.queue.Create(later);
  auto audio          = f.queue.Create(MakeJob(JOB_TYPE_AUDIO_GENERATION));

  assert(!f.queue.Claim({JOB_TYPE_VIDEO_GENERATION}).has_value());
  assert(!f.queue.Claim({JOB_TYPE_STORY_EXPANSION}).has_value());

  auto claimed = f.queue.Claim({JOB_TYPE_VIDEO_GENERATION, JOB_TYPE_AUDIO_GENERATION});
  assert(claimed->id().value() == audio.id().value());

  f.clock.Advance(10min);
  assert(f.queue.Claim({JOB_TYPE_VIDEO_GENERATION})->id().value() == delayed.id().value());
}

void TestCompleteStoresResultAndRejectsNonProcessing() {
  Fixture f;
  auto    job = f.queue.Create(MakeJob());

  google::protobuf::Struct result;
  (*result.mutable_fields())["url"].set_string_value("https://cdn.example/img.png");

  // pending: not claimable by Complete
  assert(!f.queue.Complete(job.id().value(), result));
  assert(f.queue.Get(job.id().value()).status() == JOB_STATUS_PENDING);

  f.queue.Claim();
  assert(f.queue.Complete(job.id().value(), result));

  auto done = f.queue.Get(job.id().value());
  assert(done.status() == JOB_STATUS_COMPLETED);
  assert(done.has_completed_at());
  assert(done.result().fields().at("url").string_value() == "https://cdn.example/img.png");

  // repeated completion overwrites the result
  (*result.mutable_fields())["url"].set_string_value("https://cdn.example/v2.png");
  assert(f.queue.Complete(job.id().value(), result));
  assert(f.queue.Get(job.id().value()).result().fields().at("url").string_value() == "https://cdn.example/v2.png");

  assert(Throws<workledger::util::NotFound>([&] { f.queue.Complete("missing", result); }));
}

void TestCompleteCannotResurrectCancelledJob() {
  Fixture f;
  auto    job = f.queue.Create(MakeJob());
  f.queue.Claim();

  assert(f.queue.Cancel(job.id().value()));
  assert(!f.queue.Complete(job.id().value(), {}));
  assert(f.queue.Get(job.id().value()).status() == JOB_STATUS_CANCELLED);
}

void TestFailRetriesUntilAttemptsExhausted() {
  Fixture f;
  auto submit         = MakeJob();
  submit.max_attempts = 2;
  auto job            = f.queue.Create(submit);

  f.queue.Claim();
  auto retried = f.queue.Fail(job.id().value(), "gpu out of memory");
  assert(retried.status() == JOB_STATUS_PENDING);
  assert(retried.error() == "gpu out of memory");
  assert(retried.attempts() == 1);
  assert(!retried.has_started_at());

  auto second = f.queue.Claim();
  assert(second->attempts() == 2);

  auto failed = f.queue.Fail(job.id().value(), "gpu out of memory again");
  assert(failed.status() == JOB_STATUS_FAILED);
  assert(failed.has_completed_at());
  assert(!f.queue.Claim().has_value());
}

void TestFailWithoutRetryAndWithDelay() {
  Fixture f;
  auto    a = f.queue.Create(MakeJob());
  f.queue.Claim();
  assert(f.queue.Fail(a.id().value(), "bad prompt", false).status() == JOB_STATUS_FAILED);

  auto b = f.queue.Create(MakeJob());
  f.queue.Claim();
  auto delayed = f.queue.Fail(b.id().value(), "rate limited", true, 30s);
  assert(delayed.status() == JOB_STATUS_PENDING);
  assert(!f.queue.Claim().has_value());

  f.clock.Advance(30s);
  assert(f.queue.Claim()->id().value() == b.id().value());
}

void TestImmediateRetryKeepsPlaceInClaimOrder() {
  Fixture f;
  auto    older = f.queue.Create(MakeJob());
  f.clock.Advance(1s);
  auto newer = f.queue.Create(MakeJob());

  assert(f.queue.Claim()->id().value() == older.id().value());
  auto retried = f.queue.Fail(older.id().value(), "worker restarted");
  assert(retried.scheduled_for().seconds() == older.scheduled_for().seconds());

  f.clock.Advance(1s);
  assert(f.queue.Claim()->id().value() == older.id().value());
  assert(f.queue.Claim()->id().value() == newer.id().value());
}

void TestPreEpochScheduleIsImmediatelyClaimable() {
  Fixture f;
  auto    submit       = MakeJob();
  submit.scheduled_for = workledger::util::FromUnixMillis(0) - 24h;
  auto job             = f.queue.Create(submit);

  assert(job.scheduled_for().seconds() == 0);
  auto claimed = f.queue.Claim();
  assert(claimed.has_value());
  assert(claimed->id().value() == job.id().value());
}

void TestFailIgnoresJobsNotProcessing() {
  Fixture f;
  auto    job = f.queue.Create(MakeJob());

  auto unchanged = f.queue.Fail(job.id().value(), "too early");
  assert(unchanged.status() == JOB_STATUS_PENDING);
  assert(unchanged.error().empty());
  assert(unchanged.attempts() == 0);

  assert(Throws<workledger::util::NotFound>([&] { f.queue.Fail("missing", "x"); }));
}

void TestCancelOnlyActiveJobs() {
  Fixture f;
  auto    pending = f.queue.Create(MakeJob());
  assert(f.queue.Cancel(pending.id().value()));
  assert(!f.queue.Cancel(pending.id().value()));

  auto done = f.queue.Create(MakeJob());
  f.queue.Claim();
  f.queue.Complete(done.id().value(), {});
  assert(!f.queue.Cancel(done.id().value()));
  assert(f.queue.Get(done.id().value()).status() == JOB_STATUS_COMPLETED);

  assert(Throws<workledger::util::NotFound>([&] { f.queue.Cancel("missing"); }));
}

void TestHeartbeatAndRequeueStale() {
  Fixture f;
  auto submit         = MakeJob();
  submit.max_attempts = 2;
  auto quiet          = f.queue.Create(submit);
  auto chatty         = f.queue.Create(MakeJob());

  f.queue.Claim();
  f.queue.Claim();

  f.clock.Advance(10min);
  assert(f.queue.Heartbeat(chatty.id().value()));
  f.clock.Advance(6min);

  // quiet: started 16 min ago. chatty: heartbeat 6 min ago.
  assert(f.queue.RequeueStale(15min, 100) == 1);
  auto requeued = f.queue.Get(quiet.id().value());
  assert(requeued.status() == JOB_STATUS_PENDING);
  assert(requeued.error() == "processing timed out");
  assert(f.queue.Get(chatty.id().value()).status() == JOB_STATUS_PROCESSING);

  // second time out of attempts: terminal
  f.queue.Claim();
  f.clock.Advance(16min);
  assert(f.queue.RequeueStale(15min, 100) == 2);
  assert(f.queue.Get(quiet.id().value()).status() == JOB_STATUS_FAILED);
  assert(f.queue.Get(chatty.id().value()).status() == JOB_STATUS_PENDING);

  assert(!f.queue.Heartbeat(quiet.id().value()));
}

void TestCleanupRemovesOnlyOldTerminalJobs() {
  Fixture f;
  auto    old_done = f.queue.Create(MakeJob());
  f.queue.Claim();
  f.queue.Complete(old_done.id().value(), {});

  auto old_pending = f.queue.Create(MakeJob());

  f.clock.Advance(std::chrono::hours(24 * 31));
  auto recent = f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_URGENT));
  f.queue.Claim();
  f.queue.Cancel(recent.id().value());

  assert(f.queue.Cleanup(30) == 1);
  assert(Throws<workledger::util::NotFound>([&] { f.queue.Get(old_done.id().value()); }));
  assert(f.queue.Get(old_pending.id().value()).status() == JOB_STATUS_PENDING);
  assert(f.queue.Get(recent.id().value()).status() == JOB_STATUS_CANCELLED);
}

void TestStatsCountsLastDayAndActiveByType() {
  Fixture f;
  f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION));
  f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION));
  auto video = f.queue.Create(MakeJob(JOB_TYPE_VIDEO_GENERATION, JOB_PRIORITY_URGENT));
  f.queue.Claim();

  auto stats = f.queue.Stats();
  assert(stats.last_24h().pending() == 2);
  assert(stats.last_24h().processing() == 1);
  assert(stats.active_by_type_size() == 2);

  // older than a day: drops out of last_24h but stays active
  f.clock.Advance(25h);
  auto later = f.queue.Stats();
  assert(later.last_24h().pending() == 0);
  assert(later.active_by_type_size() == 2);
  for (const auto& a : later.active_by_type()) {
    if (a.type() == JOB_TYPE_VIDEO_GENERATION) assert(a.processing() == 1 && a.pending() == 0);
    if (a.type() == JOB_TYPE_IMAGE_GENERATION) assert(a.pending() == 2);
  }
  (void)video;
}

void TestListForOwnerNewestFirstWithFilters() {
  Fixture f;
  auto    first = f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION));
  f.clock.Advance(1s);
  auto second = f.queue.Create(MakeJob(JOB_TYPE_STORY_EXPANSION));
  f.clock.Advance(1s);
  f.queue.Create(MakeJob(JOB_TYPE_IMAGE_GENERATION, JOB_PRIORITY_NORMAL, "owner-2"));

  auto all = f.queue.ListForOwner("owner-1");
  assert(all.size() == 2);
  assert(all[0].id().value() == second.id().value());
  assert(all[1].id().value() == first.id().value());

  assert(f.queue.ListForOwner("owner-1", std::nullopt, JOB_TYPE_STORY_EXPANSION).size() == 1);
  assert(f.queue.ListForOwner("owner-1", JOB_STATUS_COMPLETED).empty());
  assert(f.queue.ListForOwner("owner-1", std::nullopt, std::nullopt, 1).size() == 1);
  assert(f.queue.ListForOwner("owner-1", std::nullopt, std::nullopt, 0).size() == 1);
}

} // namespace

int main() {
  TestCreateStoresPendingJobWithDefaults();
  TestCreateValidation();
  TestClaimOrdersByPriorityThenScheduleThenInsertion();
  TestClaimSkipsFutureJobsAndFiltersByType();
  TestCompleteStoresResultAndRejectsNonProcessing();
  TestCompleteCannotResurrectCancelledJob();
  TestFailRetriesUntilAttemptsExhausted();
  TestFailWithoutRetryAndWithDelay();
  TestImmediateRetryKeepsPlaceInClaimOrder();
  TestPreEpochScheduleIsImmediatelyClaimable();
  TestFailIgnoresJobsNotProcessing();
  TestCancelOnlyActiveJobs();
  TestHeartbeatAndRequeueStale();
  TestCleanupRemovesOnlyOldTerminalJobs();
  TestStatsCountsLastDayAndActiveByType();
  TestListForOwnerNewestFirstWithFilters();

  std::cout << "workledger_unit_job_queue: pass\n";
  return 0;
}
