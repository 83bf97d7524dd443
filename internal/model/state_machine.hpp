#pragma once

#include "workledger/v1.hpp"

namespace workledger::model {

/*
  Job lifecycle

    pending -> processing -> completed
                          -> failed      (attempts exhausted or no retry)
                          -> pending     (retryable failure / stale requeue)
    pending | processing  -> cancelled
*/

constexpr bool IsTerminal(v1::JobStatus status) {
  return status == v1::JOB_STATUS_COMPLETED || status == v1::JOB_STATUS_FAILED || status == v1::JOB_STATUS_CANCELLED;
}

constexpr bool IsActive(v1::JobStatus status) {
  return status == v1::JOB_STATUS_PENDING || status == v1::JOB_STATUS_PROCESSING;
}

constexpr bool CanTransition(v1::JobStatus from, v1::JobStatus to) {
  switch (from) {
    case v1::JOB_STATUS_PENDING:
      return to == v1::JOB_STATUS_PROCESSING || to == v1::JOB_STATUS_CANCELLED;
    case v1::JOB_STATUS_PROCESSING:
      return to == v1::JOB_STATUS_COMPLETED || to == v1::JOB_STATUS_FAILED || to == v1::JOB_STATUS_PENDING || to == v1::JOB_STATUS_CANCELLED;
    case v1::JOB_STATUS_COMPLETED:
      // a repeated Complete overwrites the result
      return to == v1::JOB_STATUS_COMPLETED;
    default:
      return false;
  }
}

} // namespace workledger::model
