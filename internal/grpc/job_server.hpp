#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/job_service.hpp"
#include "workledger/v1.hpp"

namespace workledger::grpc {

class JobServer final : public v1::JobQueueService::Service {
 public:
  explicit JobServer(std::shared_ptr<workledger::service::JobService> svc);

  ::grpc::Status CreateJob(::grpc::ServerContext*, const v1::CreateJobRequest*, v1::CreateJobResponse*) override;
  ::grpc::Status GetJob(::grpc::ServerContext*, const v1::GetJobRequest*, v1::GetJobResponse*) override;
  ::grpc::Status ListJobs(::grpc::ServerContext*, const v1::ListJobsRequest*, v1::ListJobsResponse*) override;
  ::grpc::Status ClaimJob(::grpc::ServerContext*, const v1::ClaimJobRequest*, v1::ClaimJobResponse*) override;
  ::grpc::Status CompleteJob(::grpc::ServerContext*, const v1::CompleteJobRequest*, v1::CompleteJobResponse*) override;
  ::grpc::Status FailJob(::grpc::ServerContext*, const v1::FailJobRequest*, v1::FailJobResponse*) override;
  ::grpc::Status HeartbeatJob(::grpc::ServerContext*, const v1::HeartbeatJobRequest*, v1::HeartbeatJobResponse*) override;
  ::grpc::Status CancelJob(::grpc::ServerContext*, const v1::CancelJobRequest*, v1::CancelJobResponse*) override;
  ::grpc::Status CleanupJobs(::grpc::ServerContext*, const v1::CleanupJobsRequest*, v1::CleanupJobsResponse*) override;
  ::grpc::Status RequeueStaleJobs(::grpc::ServerContext*, const v1::RequeueStaleJobsRequest*, v1::RequeueStaleJobsResponse*) override;
  ::grpc::Status GetQueueStats(::grpc::ServerContext*, const v1::GetQueueStatsRequest*, v1::GetQueueStatsResponse*) override;

 private:
  std::shared_ptr<workledger::service::JobService> service_;
};

} // namespace workledger::grpc
