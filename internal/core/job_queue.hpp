#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "workledger/v1.hpp"

namespace workledger::core {

struct JobQueueOptions {
  uint32_t default_max_attempts = 3;
};

struct NewJob {
  v1::JobType              type = v1::JOB_TYPE_UNSPECIFIED;
  std::string              owner_id;
  google::protobuf::Struct payload;
  v1::JobPriority          priority = v1::JOB_PRIORITY_NORMAL;

  // unset -> JobQueueOptions::default_max_attempts
  std::optional<uint32_t> max_attempts;

  // unset -> now
  std::optional<util::TimePoint> scheduled_for;
};

/*
  Durable job queue.

  Every operation is one repository transaction. Claim and RequeueStale
  lock candidates with lock-and-skip, so concurrent callers (threads or
  processes sharing the store) never receive the same job.
*/
class JobQueue {
 public:
  static constexpr uint32_t kMaxAttemptsLimit = 100;
  static constexpr uint32_t kDefaultListLimit = 50;
  static constexpr uint32_t kMaxListLimit     = 500;

  JobQueue(std::shared_ptr<db::Repository> repository, JobQueueOptions options = {}, util::ClockFn clock = util::Now);

  v1::Job Create(const NewJob& job);

  // nullopt when nothing is eligible. Empty types = any type.
  std::optional<v1::Job> Claim(const std::vector<v1::JobType>& types = {});

  // false (and no change) unless the job is processing or already completed.
  bool Complete(const std::string& job_id, const google::protobuf::Struct& result);

  // Only acts on processing jobs; returns the job as stored afterwards.
  v1::Job Fail(const std::string& job_id, const std::string& error, bool retry = true,
               std::optional<std::chrono::milliseconds> retry_delay = std::nullopt);

  bool Cancel(const std::string& job_id);

  uint64_t Cleanup(uint32_t older_than_days);

  v1::QueueStats Stats();

  v1::Job Get(const std::string& job_id);

  std::vector<v1::Job> ListForOwner(const std::string& owner_id, std::optional<v1::JobStatus> status = std::nullopt,
                                    std::optional<v1::JobType> type = std::nullopt, uint32_t limit = kDefaultListLimit);

  bool Heartbeat(const std::string& job_id);

  // Re-queues (or fails, when out of attempts) processing jobs not seen
  // since now - timeout. Returns the number of jobs touched.
  uint32_t RequeueStale(std::chrono::milliseconds timeout, uint32_t batch_limit);

 private:
  uint64_t NowMs() const;

  // processing -> pending | failed
  void ApplyFailure(db::model::JobRecord& job, const std::string& error, bool retry, std::optional<std::chrono::milliseconds> retry_delay,
                    uint64_t now_ms) const;

  std::shared_ptr<db::Repository> repository_;
  JobQueueOptions                 options_;
  util::ClockFn                   clock_;
};

} // namespace workledger::core
