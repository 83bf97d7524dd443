#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "workledger/v1.hpp"

using namespace workledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  workledgerctl <addr> create-job <owner_id> <type> [payload_json] [priority=low|normal|high|urgent]\n"
            << "  workledgerctl <addr> get-job <job_id>\n"
            << "  workledgerctl <addr> list-jobs <owner_id> [limit]\n"
            << "  workledgerctl <addr> claim [type...]\n"
            << "  workledgerctl <addr> complete <job_id> [result_json]\n"
            << "  workledgerctl <addr> fail <job_id> <error> [--no-retry]\n"
            << "  workledgerctl <addr> heartbeat <job_id>\n"
            << "  workledgerctl <addr> cancel <job_id>\n"
            << "  workledgerctl <addr> cleanup [older_than_days]\n"
            << "  workledgerctl <addr> requeue-stale [timeout_sec]\n"
            << "  workledgerctl <addr> stats\n"
            << "  workledgerctl <addr> open-account <account_id> [starting_credits]\n"
            << "  workledgerctl <addr> balance <account_id>\n"
            << "  workledgerctl <addr> debit <account_id> <amount> [description] [reference_id]\n"
            << "  workledgerctl <addr> credit <account_id> <amount> <type=purchase|subscription|refund|bonus|adjustment> [description]\n"
            << "  workledgerctl <addr> history <account_id> [limit] [offset]\n"
            << "  workledgerctl <addr> set-subscription <account_id> <tier=free|pro|enterprise> [expires_at_rfc3339] [external_ref]\n"
            << "  workledgerctl <addr> grant <account_id> <tier=free|pro|enterprise> [monthly|yearly]\n"
            << "  workledgerctl <addr> reconcile <account_id>\n";
}

static std::string Upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

// "image_generation" -> JOB_TYPE_IMAGE_GENERATION, etc.
template <typename Enum, typename ParseFn>
static Enum ParseEnumOrExit(const std::string& prefix, const std::string& value, ParseFn parse) {
  Enum out{};
  if (!parse(prefix + Upper(value), &out)) {
    std::cerr << "unsupported value: " << value << "\n";
    std::exit(1);
  }
  return out;
}

static JobType ParseType(const std::string& value) {
  return ParseEnumOrExit<JobType>("JOB_TYPE_", value, JobType_Parse);
}

static JobID MakeID(const std::string& s) {
  JobID id;
  id.set_value(s);
  return id;
}

static void ParseJsonOrExit(const std::string& json, google::protobuf::Struct* out) {
  auto status = google::protobuf::util::JsonStringToMessage(json, out);
  if (!status.ok()) {
    std::cerr << "invalid json: " << status.message() << "\n";
    std::exit(1);
  }
}

static int Print(const google::protobuf::Message& msg) {
  std::string                             json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(msg, &json, options);
  if (!status.ok()) {
    std::cerr << status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

static int Report(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message();
    if (!status.error_details().empty()) std::cerr << " (" << status.error_details() << ")";
    std::cerr << "\n";
    return 2;
  }
  return Print(resp);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto jobs   = JobQueueService::NewStub(channel);
  auto ledger = LedgerService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------
    // Job queue
    // ------------------------------------------------------------

    if (cmd == "create-job") {
      if (argc < 5) return 1;

      CreateJobRequest req;
      req.set_owner_id(argv[3]);
      req.set_type(ParseType(argv[4]));
      if (argc >= 6) ParseJsonOrExit(argv[5], req.mutable_payload());
      if (argc >= 7) req.set_priority(ParseEnumOrExit<JobPriority>("JOB_PRIORITY_", argv[6], JobPriority_Parse));

      CreateJobResponse resp;
      return Report(jobs->CreateJob(&ctx, req, &resp), resp);
    }

    if (cmd == "get-job") {
      if (argc < 4) return 1;

      GetJobRequest req;
      *req.mutable_id() = MakeID(argv[3]);

      GetJobResponse resp;
      return Report(jobs->GetJob(&ctx, req, &resp), resp);
    }

    if (cmd == "list-jobs") {
      if (argc < 4) return 1;

      ListJobsRequest req;
      req.set_owner_id(argv[3]);
      if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

      ListJobsResponse resp;
      return Report(jobs->ListJobs(&ctx, req, &resp), resp);
    }

    if (cmd == "claim") {
      ClaimJobRequest req;
      for (int i = 3; i < argc; ++i) {
        req.add_types(ParseType(argv[i]));
      }

      ClaimJobResponse resp;
      return Report(jobs->ClaimJob(&ctx, req, &resp), resp);
    }

    if (cmd == "complete") {
      if (argc < 4) return 1;

      CompleteJobRequest req;
      *req.mutable_id() = MakeID(argv[3]);
      if (argc >= 5) ParseJsonOrExit(argv[4], req.mutable_result());

      CompleteJobResponse resp;
      return Report(jobs->CompleteJob(&ctx, req, &resp), resp);
    }

    if (cmd == "fail") {
      if (argc < 5) return 1;

      FailJobRequest req;
      *req.mutable_id() = MakeID(argv[3]);
      req.set_error(argv[4]);
      req.set_no_retry(argc >= 6 && std::string(argv[5]) == "--no-retry");

      FailJobResponse resp;
      return Report(jobs->FailJob(&ctx, req, &resp), resp);
    }

    if (cmd == "heartbeat") {
      if (argc < 4) return 1;

      HeartbeatJobRequest req;
      *req.mutable_id() = MakeID(argv[3]);

      HeartbeatJobResponse resp;
      return Report(jobs->HeartbeatJob(&ctx, req, &resp), resp);
    }

    if (cmd == "cancel") {
      if (argc < 4) return 1;

      CancelJobRequest req;
      *req.mutable_id() = MakeID(argv[3]);

      CancelJobResponse resp;
      return Report(jobs->CancelJob(&ctx, req, &resp), resp);
    }

    if (cmd == "cleanup") {
      CleanupJobsRequest req;
      if (argc >= 4) req.set_older_than_days(static_cast<uint32_t>(std::stoul(argv[3])));

      CleanupJobsResponse resp;
      return Report(jobs->CleanupJobs(&ctx, req, &resp), resp);
    }

    if (cmd == "requeue-stale") {
      RequeueStaleJobsRequest req;
      if (argc >= 4) req.mutable_processing_timeout()->set_seconds(std::stoll(argv[3]));

      RequeueStaleJobsResponse resp;
      return Report(jobs->RequeueStaleJobs(&ctx, req, &resp), resp);
    }

    if (cmd == "stats") {
      GetQueueStatsResponse resp;
      return Report(jobs->GetQueueStats(&ctx, GetQueueStatsRequest{}, &resp), resp);
    }

    // ------------------------------------------------------------
    // Ledger
    // ------------------------------------------------------------

    if (cmd == "open-account") {
      if (argc < 4) return 1;

      OpenAccountRequest req;
      req.set_account_id(argv[3]);
      if (argc >= 5) req.set_starting_credits(std::stoll(argv[4]));

      OpenAccountResponse resp;
      return Report(ledger->OpenAccount(&ctx, req, &resp), resp);
    }

    if (cmd == "balance") {
      if (argc < 4) return 1;

      GetBalanceRequest req;
      req.set_account_id(argv[3]);

      GetBalanceResponse resp;
      return Report(ledger->GetBalance(&ctx, req, &resp), resp);
    }

    if (cmd == "debit") {
      if (argc < 5) return 1;

      DebitRequest req;
      req.set_account_id(argv[3]);
      req.set_amount(std::stoll(argv[4]));
      if (argc >= 6) req.set_description(argv[5]);
      if (argc >= 7) req.set_reference_id(argv[6]);

      DebitResponse resp;
      return Report(ledger->Debit(&ctx, req, &resp), resp);
    }

    if (cmd == "credit") {
      if (argc < 6) return 1;

      CreditRequest req;
      req.set_account_id(argv[3]);
      req.set_amount(std::stoll(argv[4]));
      req.set_transaction_type(ParseEnumOrExit<TransactionType>("TRANSACTION_TYPE_", argv[5], TransactionType_Parse));
      if (argc >= 7) req.set_description(argv[6]);

      CreditResponse resp;
      return Report(ledger->Credit(&ctx, req, &resp), resp);
    }

    if (cmd == "history") {
      if (argc < 4) return 1;

      ListTransactionsRequest req;
      req.set_account_id(argv[3]);
      if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));
      if (argc >= 6) req.set_offset(static_cast<uint32_t>(std::stoul(argv[5])));

      ListTransactionsResponse resp;
      return Report(ledger->ListTransactions(&ctx, req, &resp), resp);
    }

    if (cmd == "set-subscription") {
      if (argc < 5) return 1;

      SetSubscriptionRequest req;
      req.set_account_id(argv[3]);
      req.set_tier(ParseEnumOrExit<SubscriptionTier>("SUBSCRIPTION_TIER_", argv[4], SubscriptionTier_Parse));
      if (argc >= 6 && !google::protobuf::util::TimeUtil::FromString(argv[5], req.mutable_expires_at())) {
        std::cerr << "invalid timestamp: " << argv[5] << "\n";
        return 1;
      }
      if (argc >= 7) req.set_external_subscription_ref(argv[6]);

      SetSubscriptionResponse resp;
      return Report(ledger->SetSubscription(&ctx, req, &resp), resp);
    }

    if (cmd == "grant") {
      if (argc < 5) return 1;

      GrantSubscriptionRequest req;
      req.set_account_id(argv[3]);
      req.set_tier(ParseEnumOrExit<SubscriptionTier>("SUBSCRIPTION_TIER_", argv[4], SubscriptionTier_Parse));
      if (argc >= 6) req.set_duration(ParseEnumOrExit<GrantDuration>("GRANT_DURATION_", argv[5], GrantDuration_Parse));

      GrantSubscriptionResponse resp;
      return Report(ledger->GrantSubscription(&ctx, req, &resp), resp);
    }

    if (cmd == "reconcile") {
      if (argc < 4) return 1;

      ReconcileRequest req;
      req.set_account_id(argv[3]);

      ReconcileResponse resp;
      return Report(ledger->Reconcile(&ctx, req, &resp), resp);
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid number: " << e.what() << "\n";
    return 1;
  } catch (const std::out_of_range& e) {
    std::cerr << "number out of range: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
