#include "job_reaper.hpp"

#include <stdexcept>

#include "internal/core/job_queue.hpp"
#include "internal/observability/logging.hpp"

namespace workledger::reaper {

using observability::IntField;
using observability::StringField;

JobReaper::JobReaper(std::shared_ptr<core::JobQueue> queue, ReaperOptions options) : queue_(std::move(queue)), options_(options) {
  if (!queue_) throw std::invalid_argument("JobReaper requires a job queue");
  if (options_.interval <= std::chrono::milliseconds::zero()) throw std::invalid_argument("reaper interval must be > 0");
  if (options_.batch_limit == 0) options_.batch_limit = 100;
}

JobReaper::~JobReaper() {
  Stop();
}

void JobReaper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&JobReaper::Loop, this);

  WORKLEDGER_LOG_INFO("job reaper started", {IntField("interval_ms", options_.interval.count()),
                                             IntField("processing_timeout_ms", options_.processing_timeout.count()),
                                             IntField("retention_days", options_.retention_days)});
}

void JobReaper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

ReaperPass JobReaper::RunOnce() {
  ReaperPass pass;
  pass.requeued = queue_->RequeueStale(options_.processing_timeout, options_.batch_limit);
  if (options_.retention_days > 0) {
    pass.deleted = queue_->Cleanup(options_.retention_days);
  }

  if (pass.requeued > 0 || pass.deleted > 0) {
    WORKLEDGER_LOG_INFO("reaper pass", {IntField("requeued", pass.requeued), IntField("deleted", static_cast<int64_t>(pass.deleted))});
  }
  return pass;
}

void JobReaper::Loop() {
  while (running_) {
    try {
      RunOnce();
    } catch (const std::exception& e) {
      // next pass retries; the store may be briefly unavailable
      WORKLEDGER_LOG_ERROR("reaper pass failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    wake_.wait_for(lock, options_.interval, [this] { return !running_; });
  }
}

} // namespace workledger::reaper
