#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "workledger/v1.hpp"

namespace workledger::db::model {

/*
  Persistent job row.

  - seq is assigned by the store on insert and is the final claim tie-break.
  - payload/result hold JSON object text.
  - Optional timestamps are epoch ms; nullopt maps to SQL NULL.
*/

struct JobRecord {
  uint64_t    seq = 0;
  std::string id;

  v1::JobType   type   = v1::JOB_TYPE_UNSPECIFIED;
  v1::JobStatus status = v1::JOB_STATUS_PENDING;

  // stored weight (1/5/10/20), not the wire enum
  int32_t priority = 5;

  std::string owner_id;

  std::string                payload = "{}";
  std::optional<std::string> result;
  std::optional<std::string> error;

  uint32_t attempts     = 0;
  uint32_t max_attempts = 3;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> started_at_ms;
  std::optional<uint64_t> completed_at_ms;
  uint64_t                scheduled_for_ms = 0;
  std::optional<uint64_t> heartbeat_at_ms;
};

struct JobFilter {
  std::string                  owner_id;
  std::optional<v1::JobStatus> status;
  std::optional<v1::JobType>   type;
  uint32_t                     limit = 50;
};

struct StatusCount {
  v1::JobStatus status = v1::JOB_STATUS_UNSPECIFIED;
  uint64_t      count  = 0;
};

struct TypeStatusCount {
  v1::JobType   type   = v1::JOB_TYPE_UNSPECIFIED;
  v1::JobStatus status = v1::JOB_STATUS_UNSPECIFIED;
  uint64_t      count  = 0;
};

} // namespace workledger::db::model
