#include "job_service.hpp"

#include <stdexcept>

#include "internal/core/job_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace workledger::service {

namespace {

const std::string& RequireId(const v1::JobID& id) {
  if (id.value().empty()) throw util::InvalidArgument("job id is required");
  return id.value();
}

} // namespace

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.jobs) throw std::invalid_argument("JobService requires a job queue");
}

v1::CreateJobResponse JobService::CreateJob(const v1::CreateJobRequest& req) {
  return ObserveRpc("JobQueueService.CreateJob", "owner_id", req.owner_id(), [&] {
    core::NewJob job;
    job.type     = req.type();
    job.owner_id = req.owner_id();
    job.payload  = req.payload();
    job.priority = req.priority();
    if (req.max_attempts() > 0) job.max_attempts = req.max_attempts();
    if (req.has_scheduled_for()) job.scheduled_for = util::FromProto(req.scheduled_for());

    v1::CreateJobResponse resp;
    *resp.mutable_job() = ctx_.jobs->Create(job);
    return resp;
  });
}

v1::GetJobResponse JobService::GetJob(const v1::GetJobRequest& req) {
  return ObserveRpc("JobQueueService.GetJob", "job_id", req.id().value(), [&] {
    v1::GetJobResponse resp;
    *resp.mutable_job() = ctx_.jobs->Get(RequireId(req.id()));
    return resp;
  });
}

v1::ListJobsResponse JobService::ListJobs(const v1::ListJobsRequest& req) {
  return ObserveRpc("JobQueueService.ListJobs", "owner_id", req.owner_id(), [&] {
    if (req.owner_id().empty()) throw util::InvalidArgument("owner_id is required");

    std::optional<v1::JobStatus> status;
    if (req.status() != v1::JOB_STATUS_UNSPECIFIED) status = req.status();
    std::optional<v1::JobType> type;
    if (req.type() != v1::JOB_TYPE_UNSPECIFIED) type = req.type();
    const uint32_t limit = req.limit() == 0 ? core::JobQueue::kDefaultListLimit : req.limit();

    v1::ListJobsResponse resp;
    for (auto& job : ctx_.jobs->ListForOwner(req.owner_id(), status, type, limit)) {
      *resp.add_jobs() = std::move(job);
    }
    return resp;
  });
}

v1::ClaimJobResponse JobService::ClaimJob(const v1::ClaimJobRequest& req) {
  return ObserveRpc("JobQueueService.ClaimJob", "job_id", "", [&] {
    std::vector<v1::JobType> types;
    types.reserve(req.types_size());
    for (int i = 0; i < req.types_size(); ++i) {
      types.push_back(req.types(i));
    }

    v1::ClaimJobResponse resp;
    if (auto job = ctx_.jobs->Claim(types)) {
      resp.set_found(true);
      *resp.mutable_job() = std::move(*job);
    }
    return resp;
  });
}

v1::CompleteJobResponse JobService::CompleteJob(const v1::CompleteJobRequest& req) {
  return ObserveRpc("JobQueueService.CompleteJob", "job_id", req.id().value(), [&] {
    v1::CompleteJobResponse resp;
    resp.set_completed(ctx_.jobs->Complete(RequireId(req.id()), req.result()));
    return resp;
  });
}

v1::FailJobResponse JobService::FailJob(const v1::FailJobRequest& req) {
  return ObserveRpc("JobQueueService.FailJob", "job_id", req.id().value(), [&] {
    std::optional<std::chrono::milliseconds> delay;
    if (req.has_retry_delay()) {
      delay = util::FromProto(req.retry_delay());
      if (delay->count() < 0) throw util::InvalidArgument("retry_delay must not be negative");
    } else if (ctx_.defaults.retry_backoff.count() > 0) {
      delay = ctx_.defaults.retry_backoff;
    }

    v1::FailJobResponse resp;
    *resp.mutable_job() = ctx_.jobs->Fail(RequireId(req.id()), req.error(), !req.no_retry(), delay);
    return resp;
  });
}

v1::HeartbeatJobResponse JobService::HeartbeatJob(const v1::HeartbeatJobRequest& req) {
  return ObserveRpc("JobQueueService.HeartbeatJob", "job_id", req.id().value(), [&] {
    v1::HeartbeatJobResponse resp;
    resp.set_alive(ctx_.jobs->Heartbeat(RequireId(req.id())));
    return resp;
  });
}

v1::CancelJobResponse JobService::CancelJob(const v1::CancelJobRequest& req) {
  return ObserveRpc("JobQueueService.CancelJob", "job_id", req.id().value(), [&] {
    v1::CancelJobResponse resp;
    resp.set_cancelled(ctx_.jobs->Cancel(RequireId(req.id())));
    return resp;
  });
}

v1::CleanupJobsResponse JobService::CleanupJobs(const v1::CleanupJobsRequest& req) {
  return ObserveRpc("JobQueueService.CleanupJobs", "job_id", "", [&] {
    const uint32_t days = req.older_than_days() == 0 ? ctx_.defaults.cleanup_older_than_days : req.older_than_days();

    v1::CleanupJobsResponse resp;
    resp.set_deleted(ctx_.jobs->Cleanup(days));
    return resp;
  });
}

v1::RequeueStaleJobsResponse JobService::RequeueStaleJobs(const v1::RequeueStaleJobsRequest& req) {
  return ObserveRpc("JobQueueService.RequeueStaleJobs", "job_id", "", [&] {
    auto timeout = ctx_.defaults.processing_timeout;
    if (req.has_processing_timeout()) {
      timeout = util::FromProto(req.processing_timeout());
      if (timeout.count() <= 0) throw util::InvalidArgument("processing_timeout must be > 0");
    }
    const uint32_t batch = req.batch_limit() == 0 ? ctx_.defaults.requeue_batch_limit : req.batch_limit();

    v1::RequeueStaleJobsResponse resp;
    resp.set_touched(ctx_.jobs->RequeueStale(timeout, batch));
    return resp;
  });
}

v1::GetQueueStatsResponse JobService::GetQueueStats(const v1::GetQueueStatsRequest&) {
  return ObserveRpc("JobQueueService.GetQueueStats", "job_id", "", [&] {
    v1::GetQueueStatsResponse resp;
    *resp.mutable_stats() = ctx_.jobs->Stats();
    return resp;
  });
}

} // namespace workledger::service
