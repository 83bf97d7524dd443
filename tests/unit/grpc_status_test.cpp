#include <grpcpp/grpcpp.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/core/credits_ledger.hpp"
#include "internal/core/job_queue.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "workledger/v1.hpp"

namespace {

using namespace workledger::v1;
using workledger::grpc::ToStatus;

workledger::service::ServiceContext BuildServiceContext() {
  auto repository = std::make_shared<workledger::db::memory::MemoryRepository>();

  workledger::service::ServiceContext ctx;
  ctx.jobs   = std::make_shared<workledger::core::JobQueue>(repository);
  ctx.ledger = std::make_shared<workledger::core::CreditsLedger>(repository);
  return ctx;
}

void TestExceptionMapping() {
  assert(ToStatus(workledger::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(workledger::util::UserNotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(workledger::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(workledger::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(workledger::util::InvalidAmount("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto insufficient = ToStatus(workledger::util::InsufficientCredits("insufficient credits", 3, 10));
  assert(insufficient.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(insufficient.error_details() == "available=3 required=10");
}

void TestClaimWithNothingEligibleIsOk() {
  auto ctx = BuildServiceContext();
  workledger::grpc::JobServer server(std::make_shared<workledger::service::JobService>(ctx));

  ClaimJobRequest       req;
  ClaimJobResponse      resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ClaimJob(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.found());
}

void TestJobLifecycleThroughAdapters() {
  auto ctx = BuildServiceContext();
  workledger::grpc::JobServer    jobs(std::make_shared<workledger::service::JobService>(ctx));
  workledger::grpc::LedgerServer ledger(std::make_shared<workledger::service::LedgerService>(ctx));
  ::grpc::ServerContext          grpc_ctx;

  OpenAccountRequest open;
  open.set_account_id("owner");
  OpenAccountResponse opened;
  assert(ledger.OpenAccount(&grpc_ctx, &open, &opened).ok());

  CreateJobRequest create;
  create.set_type(JOB_TYPE_MUSIC_GENERATION);
  create.set_owner_id("owner");
  create.set_priority(JOB_PRIORITY_HIGH);
  CreateJobResponse created;
  assert(jobs.CreateJob(&grpc_ctx, &create, &created).ok());
  assert(created.job().max_attempts() == 3);
  assert(created.job().priority() == JOB_PRIORITY_HIGH);

  ClaimJobRequest claim;
  claim.add_types(JOB_TYPE_MUSIC_GENERATION);
  ClaimJobResponse claimed;
  assert(jobs.ClaimJob(&grpc_ctx, &claim, &claimed).ok());
  assert(claimed.found());
  assert(claimed.job().id().value() == created.job().id().value());

  FailJobRequest fail;
  *fail.mutable_id() = created.job().id();
  fail.set_error("model crashed");
  fail.set_no_retry(true);
  FailJobResponse failed;
  assert(jobs.FailJob(&grpc_ctx, &fail, &failed).ok());
  assert(failed.job().status() == JOB_STATUS_FAILED);

  CancelJobRequest cancel;
  *cancel.mutable_id() = created.job().id();
  CancelJobResponse cancelled;
  assert(jobs.CancelJob(&grpc_ctx, &cancel, &cancelled).ok());
  assert(!cancelled.cancelled());
}

void TestStatusCodesFromAdapters() {
  auto ctx = BuildServiceContext();
  workledger::grpc::JobServer    jobs(std::make_shared<workledger::service::JobService>(ctx));
  workledger::grpc::LedgerServer ledger(std::make_shared<workledger::service::LedgerService>(ctx));
  ::grpc::ServerContext          grpc_ctx;

  GetJobRequest get;
  get.mutable_id()->set_value("missing-job");
  GetJobResponse got;
  assert(jobs.GetJob(&grpc_ctx, &get, &got).error_code() == ::grpc::StatusCode::NOT_FOUND);

  CreateJobRequest create;
  create.set_type(JOB_TYPE_IMAGE_GENERATION);
  create.set_owner_id("nobody");
  CreateJobResponse created;
  assert(jobs.CreateJob(&grpc_ctx, &create, &created).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  OpenAccountRequest open;
  open.set_account_id("poor");
  open.set_starting_credits(1);
  OpenAccountResponse opened;
  assert(ledger.OpenAccount(&grpc_ctx, &open, &opened).ok());
  assert(ledger.OpenAccount(&grpc_ctx, &open, &opened).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  DebitRequest debit;
  debit.set_account_id("poor");
  debit.set_amount(5);
  DebitResponse debited;
  assert(ledger.Debit(&grpc_ctx, &debit, &debited).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  debit.set_amount(0);
  assert(ledger.Debit(&grpc_ctx, &debit, &debited).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  debit.set_account_id("ghost");
  debit.set_amount(1);
  assert(ledger.Debit(&grpc_ctx, &debit, &debited).error_code() == ::grpc::StatusCode::NOT_FOUND);

  debit.set_account_id("poor");
  assert(ledger.Debit(&grpc_ctx, &debit, &debited).ok());
  assert(debited.credits_remaining() == 0);
  assert(debited.transaction().transaction_type() == TRANSACTION_TYPE_GENERATION);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestClaimWithNothingEligibleIsOk();
  TestJobLifecycleThroughAdapters();
  TestStatusCodesFromAdapters();

  std::cout << "workledger_unit_grpc_status: pass\n";
  return 0;
}
