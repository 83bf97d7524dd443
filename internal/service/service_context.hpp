#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

namespace workledger::core {
class JobQueue;
class CreditsLedger;
} // namespace workledger::core

namespace workledger::service {

// Request defaults that come from configuration rather than the caller.
struct ServiceDefaults {
  std::chrono::milliseconds retry_backoff{0};
  std::chrono::milliseconds processing_timeout{15 * 60'000};
  uint32_t                  requeue_batch_limit     = 100;
  uint32_t                  cleanup_older_than_days = 30;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<workledger::core::JobQueue>      jobs;
  std::shared_ptr<workledger::core::CreditsLedger> ledger;
  ServiceDefaults                                  defaults;
};

} // namespace workledger::service
