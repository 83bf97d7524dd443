#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/credits_ledger.hpp"
#include "internal/core/job_queue.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/reaper/job_reaper.hpp"

namespace workledger::factory {

/*
  Application

  Owns every long-lived object used by the server. The gRPC services
  are moved into runtime::Server; the rest lives as long as this struct.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<core::JobQueue>                 jobs;
  std::shared_ptr<core::CreditsLedger>            ledger;
  std::shared_ptr<reaper::JobReaper>              reaper;
  std::vector<std::unique_ptr<::grpc::Service>>   grpc_services;
};

/*
  Composition root: the only place that knows concrete repository types.
  Runs schema migrations for SQL backends. Does not start the reaper.
*/
std::shared_ptr<db::Repository> BuildRepository(const workledger::runtime::config::RuntimeConfig& config);

Application Build(const workledger::runtime::config::RuntimeConfig& config);

} // namespace workledger::factory
