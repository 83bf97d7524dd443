#include "job_server.hpp"

#include <stdexcept>

#include "grpc_error.hpp"

namespace workledger::grpc {

JobServer::JobServer(std::shared_ptr<workledger::service::JobService> svc) : service_(std::move(svc)) {
  if (!service_) throw std::invalid_argument("JobServer requires a service");
}

::grpc::Status JobServer::CreateJob(::grpc::ServerContext*, const v1::CreateJobRequest* req, v1::CreateJobResponse* resp) {
  try {
    *resp = service_->CreateJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetJob(::grpc::ServerContext*, const v1::GetJobRequest* req, v1::GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListJobs(::grpc::ServerContext*, const v1::ListJobsRequest* req, v1::ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ClaimJob(::grpc::ServerContext*, const v1::ClaimJobRequest* req, v1::ClaimJobResponse* resp) {
  try {
    *resp = service_->ClaimJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::CompleteJob(::grpc::ServerContext*, const v1::CompleteJobRequest* req, v1::CompleteJobResponse* resp) {
  try {
    *resp = service_->CompleteJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::FailJob(::grpc::ServerContext*, const v1::FailJobRequest* req, v1::FailJobResponse* resp) {
  try {
    *resp = service_->FailJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::HeartbeatJob(::grpc::ServerContext*, const v1::HeartbeatJobRequest* req, v1::HeartbeatJobResponse* resp) {
  try {
    *resp = service_->HeartbeatJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::CancelJob(::grpc::ServerContext*, const v1::CancelJobRequest* req, v1::CancelJobResponse* resp) {
  try {
    *resp = service_->CancelJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::CleanupJobs(::grpc::ServerContext*, const v1::CleanupJobsRequest* req, v1::CleanupJobsResponse* resp) {
  try {
    *resp = service_->CleanupJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::RequeueStaleJobs(::grpc::ServerContext*, const v1::RequeueStaleJobsRequest* req, v1::RequeueStaleJobsResponse* resp) {
  try {
    *resp = service_->RequeueStaleJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetQueueStats(::grpc::ServerContext*, const v1::GetQueueStatsRequest* req, v1::GetQueueStatsResponse* resp) {
  try {
    *resp = service_->GetQueueStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace workledger::grpc
