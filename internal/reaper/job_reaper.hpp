#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace workledger::core {
class JobQueue;
}

namespace workledger::reaper {

struct ReaperOptions {
  std::chrono::milliseconds interval{30'000};
  std::chrono::milliseconds processing_timeout{15 * 60'000};
  uint32_t                  batch_limit    = 100;
  uint32_t                  retention_days = 0; // 0 = keep terminal jobs forever
};

struct ReaperPass {
  uint32_t requeued = 0;
  uint64_t deleted  = 0;
};

/*
  Background worker that recovers work lost to dead workers.

  Each pass:
      processing jobs without a heartbeat since now - timeout -> pending | failed
      terminal jobs older than retention_days                  -> deleted
*/
class JobReaper {
 public:
  JobReaper(std::shared_ptr<core::JobQueue> queue, ReaperOptions options);
  ~JobReaper();

  void Start();
  void Stop();

  ReaperPass RunOnce();

  bool Running() const {
    return running_;
  }

 private:
  void Loop();

  std::shared_ptr<core::JobQueue> queue_;
  ReaperOptions                   options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable wake_;
};

} // namespace workledger::reaper
