#include "internal/core/job_queue.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <map>
#include <stdexcept>

#include "internal/core/store_errors.hpp"
#include "internal/model/codes.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace workledger::core {

using observability::IntField;
using observability::StringField;

namespace {

constexpr uint64_t kDayMs = 24ull * 60 * 60 * 1000;

std::string ToJson(const google::protobuf::Struct& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw util::InvalidArgument("payload is not serializable: " + std::string(status.message()));
  }
  return json;
}

google::protobuf::Struct FromJson(const std::string& json) {
  google::protobuf::Struct value;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw std::runtime_error("stored job JSON is not an object: " + std::string(status.message()));
  }
  return value;
}

v1::Job ToProto(const db::model::JobRecord& r) {
  v1::Job job;
  job.mutable_id()->set_value(r.id);
  job.set_type(r.type);
  job.set_status(r.status);
  job.set_priority(model::PriorityFromWeight(r.priority));
  job.set_owner_id(r.owner_id);
  *job.mutable_payload() = FromJson(r.payload);
  if (r.result) *job.mutable_result() = FromJson(*r.result);
  if (r.error) job.set_error(*r.error);
  job.set_attempts(r.attempts);
  job.set_max_attempts(r.max_attempts);

  *job.mutable_created_at()    = util::ToProto(util::FromUnixMillis(r.created_at_ms));
  *job.mutable_scheduled_for() = util::ToProto(util::FromUnixMillis(r.scheduled_for_ms));
  if (r.started_at_ms) *job.mutable_started_at() = util::ToProto(util::FromUnixMillis(*r.started_at_ms));
  if (r.completed_at_ms) *job.mutable_completed_at() = util::ToProto(util::FromUnixMillis(*r.completed_at_ms));
  if (r.heartbeat_at_ms) *job.mutable_heartbeat_at() = util::ToProto(util::FromUnixMillis(*r.heartbeat_at_ms));
  return job;
}

db::model::JobRecord LockOrThrow(db::Repository& repo, db::Transaction& tx, const std::string& job_id) {
  auto job = repo.LockJob(tx, job_id);
  if (!job) throw util::NotFound("job not found: " + job_id);
  return *job;
}

void LogTransition(std::string_view event, const db::model::JobRecord& job) {
  WORKLEDGER_LOG_INFO(event, {StringField("job_id", job.id), StringField("type", model::ToString(job.type)),
                              StringField("status", model::ToString(job.status)), IntField("attempts", job.attempts)});
  observability::Metrics::Instance().RecordJobTransition(model::ToString(job.status));
}

} // namespace

JobQueue::JobQueue(std::shared_ptr<db::Repository> repository, JobQueueOptions options, util::ClockFn clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
  if (!repository_) throw std::invalid_argument("JobQueue requires a repository");
  if (!clock_) clock_ = util::Now;
  if (options_.default_max_attempts == 0) options_.default_max_attempts = 3;
}

uint64_t JobQueue::NowMs() const {
  return util::ToUnixMillis(clock_());
}

// ---------------------------------------------------------------------------
// Submission
// ---------------------------------------------------------------------------

v1::Job JobQueue::Create(const NewJob& request) {
  if (!model::IsKnownJobType(request.type)) {
    throw util::InvalidArgument("unknown job type: " + std::to_string(static_cast<int>(request.type)));
  }
  if (request.owner_id.empty()) {
    throw util::InvalidArgument("owner_id is required");
  }

  const uint32_t max_attempts = request.max_attempts.value_or(options_.default_max_attempts);
  if (max_attempts < 1 || max_attempts > kMaxAttemptsLimit) {
    throw util::InvalidArgument("max_attempts must be in [1, 100]");
  }

  const uint64_t now = NowMs();

  db::model::JobRecord r;
  r.id               = util::NewId();
  r.type             = request.type;
  r.status           = v1::JOB_STATUS_PENDING;
  r.priority         = model::PriorityWeight(request.priority);
  r.owner_id         = request.owner_id;
  r.payload          = ToJson(request.payload);
  r.attempts         = 0;
  r.max_attempts     = max_attempts;
  r.created_at_ms    = now;
  r.scheduled_for_ms = request.scheduled_for ? util::ToUnixMillis(*request.scheduled_for) : now;

  auto tx = repository_->Begin();
  if (!repository_->GetAccount(*tx, r.owner_id)) {
    throw util::InvalidArgument("unknown owner: " + r.owner_id);
  }
  ThrowIfDbError(repository_->InsertJob(*tx, r), "insert job");
  tx->Commit();

  WORKLEDGER_LOG_INFO("job created", {StringField("job_id", r.id), StringField("type", model::ToString(r.type)),
                                      StringField("owner_id", r.owner_id), IntField("priority", r.priority),
                                      IntField("scheduled_for_ms", static_cast<int64_t>(r.scheduled_for_ms))});
  observability::Metrics::Instance().RecordJobTransition(model::ToString(r.status));
  return ToProto(r);
}

// ---------------------------------------------------------------------------
// Worker path
// ---------------------------------------------------------------------------

std::optional<v1::Job> JobQueue::Claim(const std::vector<v1::JobType>& types) {
  const uint64_t now = NowMs();

  auto tx  = repository_->Begin();
  auto job = repository_->LockNextClaimableJob(*tx, types, now);
  if (!job) {
    tx->Commit();
    return std::nullopt;
  }

  job->status        = v1::JOB_STATUS_PROCESSING;
  job->started_at_ms = now;
  job->heartbeat_at_ms.reset();
  job->attempts += 1;

  ThrowIfDbError(repository_->UpdateJob(*tx, *job), "claim job");
  tx->Commit();

  LogTransition("job claimed", *job);
  return ToProto(*job);
}

bool JobQueue::Complete(const std::string& job_id, const google::protobuf::Struct& result) {
  auto tx  = repository_->Begin();
  auto job = LockOrThrow(*repository_, *tx, job_id);

  if (!model::CanTransition(job.status, v1::JOB_STATUS_COMPLETED)) {
    WORKLEDGER_LOG_WARN("job complete ignored", {StringField("job_id", job_id), StringField("status", model::ToString(job.status))});
    return false;
  }

  job.status          = v1::JOB_STATUS_COMPLETED;
  job.result          = ToJson(result);
  job.error.reset();
  job.completed_at_ms = NowMs();

  ThrowIfDbError(repository_->UpdateJob(*tx, job), "complete job");
  tx->Commit();

  LogTransition("job completed", job);
  return true;
}

void JobQueue::ApplyFailure(db::model::JobRecord& job, const std::string& error, bool retry, std::optional<std::chrono::milliseconds> retry_delay,
                            uint64_t now_ms) const {
  job.error = error;
  job.heartbeat_at_ms.reset();

  if (retry && job.attempts < job.max_attempts) {
    job.status = v1::JOB_STATUS_PENDING;
    job.started_at_ms.reset();
    // without a delay the job keeps its original place in the claim order
    if (retry_delay && retry_delay->count() > 0) {
      job.scheduled_for_ms = now_ms + static_cast<uint64_t>(retry_delay->count());
    }
    return;
  }

  job.status          = v1::JOB_STATUS_FAILED;
  job.completed_at_ms = now_ms;
}

v1::Job JobQueue::Fail(const std::string& job_id, const std::string& error, bool retry, std::optional<std::chrono::milliseconds> retry_delay) {
  auto tx  = repository_->Begin();
  auto job = LockOrThrow(*repository_, *tx, job_id);

  if (job.status != v1::JOB_STATUS_PROCESSING) {
    WORKLEDGER_LOG_WARN("job fail ignored", {StringField("job_id", job_id), StringField("status", model::ToString(job.status))});
    tx->Commit();
    return ToProto(job);
  }

  ApplyFailure(job, error, retry, retry_delay, NowMs());
  ThrowIfDbError(repository_->UpdateJob(*tx, job), "fail job");
  tx->Commit();

  LogTransition(job.status == v1::JOB_STATUS_PENDING ? "job requeued" : "job failed", job);
  return ToProto(job);
}

bool JobQueue::Heartbeat(const std::string& job_id) {
  auto tx  = repository_->Begin();
  auto job = LockOrThrow(*repository_, *tx, job_id);

  if (job.status != v1::JOB_STATUS_PROCESSING) return false;

  job.heartbeat_at_ms = NowMs();
  ThrowIfDbError(repository_->UpdateJob(*tx, job), "heartbeat job");
  tx->Commit();
  return true;
}

bool JobQueue::Cancel(const std::string& job_id) {
  auto tx  = repository_->Begin();
  auto job = LockOrThrow(*repository_, *tx, job_id);

  if (!model::CanTransition(job.status, v1::JOB_STATUS_CANCELLED)) {
    return false;
  }

  job.status          = v1::JOB_STATUS_CANCELLED;
  job.completed_at_ms = NowMs();
  job.heartbeat_at_ms.reset();

  ThrowIfDbError(repository_->UpdateJob(*tx, job), "cancel job");
  tx->Commit();

  LogTransition("job cancelled", job);
  return true;
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

uint32_t JobQueue::RequeueStale(std::chrono::milliseconds timeout, uint32_t batch_limit) {
  if (batch_limit == 0) return 0;

  const uint64_t now        = NowMs();
  const uint64_t timeout_ms = static_cast<uint64_t>(std::max<int64_t>(timeout.count(), 0));
  const uint64_t cutoff     = now > timeout_ms ? now - timeout_ms : 0;

  auto tx    = repository_->Begin();
  auto stale = repository_->LockStaleProcessingJobs(*tx, cutoff, batch_limit);

  for (auto& job : stale) {
    ApplyFailure(job, "processing timed out", true, std::nullopt, now);
    ThrowIfDbError(repository_->UpdateJob(*tx, job), "requeue stale job");
  }
  tx->Commit();

  for (const auto& job : stale) {
    LogTransition(job.status == v1::JOB_STATUS_PENDING ? "stale job requeued" : "stale job failed", job);
  }
  return static_cast<uint32_t>(stale.size());
}

uint64_t JobQueue::Cleanup(uint32_t older_than_days) {
  const uint64_t now    = NowMs();
  const uint64_t window = static_cast<uint64_t>(older_than_days) * kDayMs;
  const uint64_t cutoff = now > window ? now - window : 0;

  uint64_t deleted = 0;
  auto     tx      = repository_->Begin();
  ThrowIfDbError(repository_->DeleteTerminalJobsCompletedBefore(*tx, cutoff, deleted), "cleanup jobs");
  tx->Commit();

  WORKLEDGER_LOG_INFO("job cleanup", {IntField("older_than_days", older_than_days), IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

v1::QueueStats JobQueue::Stats() {
  const uint64_t now   = NowMs();
  const uint64_t since = now > kDayMs ? now - kDayMs : 0;

  auto tx        = repository_->Begin();
  auto by_status = repository_->CountJobsByStatusSince(*tx, since);
  auto by_type   = repository_->CountActiveJobsByType(*tx);
  tx->Commit();

  v1::QueueStats stats;
  auto*          last_24h = stats.mutable_last_24h();
  for (const auto& c : by_status) {
    switch (c.status) {
      case v1::JOB_STATUS_PENDING:
        last_24h->set_pending(c.count);
        break;
      case v1::JOB_STATUS_PROCESSING:
        last_24h->set_processing(c.count);
        break;
      case v1::JOB_STATUS_COMPLETED:
        last_24h->set_completed(c.count);
        break;
      case v1::JOB_STATUS_FAILED:
        last_24h->set_failed(c.count);
        break;
      case v1::JOB_STATUS_CANCELLED:
        last_24h->set_cancelled(c.count);
        break;
      default:
        break;
    }
  }

  std::map<v1::JobType, v1::TypeActivity> activity;
  for (const auto& c : by_type) {
    auto& entry = activity[c.type];
    entry.set_type(c.type);
    if (c.status == v1::JOB_STATUS_PENDING) entry.set_pending(entry.pending() + c.count);
    if (c.status == v1::JOB_STATUS_PROCESSING) entry.set_processing(entry.processing() + c.count);
  }
  for (auto& [type, entry] : activity) {
    *stats.add_active_by_type() = std::move(entry);
  }
  return stats;
}

v1::Job JobQueue::Get(const std::string& job_id) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  tx->Commit();

  if (!job) throw util::NotFound("job not found: " + job_id);
  return ToProto(*job);
}

std::vector<v1::Job> JobQueue::ListForOwner(const std::string& owner_id, std::optional<v1::JobStatus> status, std::optional<v1::JobType> type,
                                            uint32_t limit) {
  db::model::JobFilter filter;
  filter.owner_id = owner_id;
  filter.status   = status;
  filter.type     = type;
  filter.limit    = std::clamp<uint32_t>(limit, 1, kMaxListLimit);

  auto tx   = repository_->Begin();
  auto rows = repository_->ListJobsByOwner(*tx, filter);
  tx->Commit();

  std::vector<v1::Job> out;
  out.reserve(rows.size());
  for (const auto& r : rows) {
    out.push_back(ToProto(r));
  }
  return out;
}

} // namespace workledger::core
