#pragma once

#include "service_context.hpp"
#include "workledger/v1.hpp"

namespace workledger::service {

class JobService {
 public:
  explicit JobService(ServiceContext ctx);

  v1::CreateJobResponse        CreateJob(const v1::CreateJobRequest& req);
  v1::GetJobResponse           GetJob(const v1::GetJobRequest& req);
  v1::ListJobsResponse         ListJobs(const v1::ListJobsRequest& req);
  v1::ClaimJobResponse         ClaimJob(const v1::ClaimJobRequest& req);
  v1::CompleteJobResponse      CompleteJob(const v1::CompleteJobRequest& req);
  v1::FailJobResponse          FailJob(const v1::FailJobRequest& req);
  v1::HeartbeatJobResponse     HeartbeatJob(const v1::HeartbeatJobRequest& req);
  v1::CancelJobResponse        CancelJob(const v1::CancelJobRequest& req);
  v1::CleanupJobsResponse      CleanupJobs(const v1::CleanupJobsRequest& req);
  v1::RequeueStaleJobsResponse RequeueStaleJobs(const v1::RequeueStaleJobsRequest& req);
  v1::GetQueueStatsResponse    GetQueueStats(const v1::GetQueueStatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace workledger::service
