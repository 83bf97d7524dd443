#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "workledger/v1.hpp"

namespace workledger::model {

/*
  Store codes for the wire enums.

  SQL rows keep status/type/tier as lowercase text and priority as a
  weight with gaps (1/5/10/20) so intermediate tiers can be added
  without a migration.
*/

// ---------------------------------------------------------------------------
// Job type
// ---------------------------------------------------------------------------

constexpr std::string_view ToString(v1::JobType type) {
  switch (type) {
    case v1::JOB_TYPE_IMAGE_GENERATION:
      return "image_generation";
    case v1::JOB_TYPE_VIDEO_GENERATION:
      return "video_generation";
    case v1::JOB_TYPE_AUDIO_GENERATION:
      return "audio_generation";
    case v1::JOB_TYPE_MUSIC_GENERATION:
      return "music_generation";
    case v1::JOB_TYPE_VOICEOVER_GENERATION:
      return "voiceover_generation";
    case v1::JOB_TYPE_STORY_EXPANSION:
      return "story_expansion";
    default:
      return "unspecified";
  }
}

inline std::optional<v1::JobType> ParseJobType(std::string_view s) {
  for (auto t : {v1::JOB_TYPE_IMAGE_GENERATION, v1::JOB_TYPE_VIDEO_GENERATION, v1::JOB_TYPE_AUDIO_GENERATION, v1::JOB_TYPE_MUSIC_GENERATION,
                 v1::JOB_TYPE_VOICEOVER_GENERATION, v1::JOB_TYPE_STORY_EXPANSION}) {
    if (ToString(t) == s) return t;
  }
  return std::nullopt;
}

constexpr bool IsKnownJobType(v1::JobType type) {
  return type >= v1::JOB_TYPE_IMAGE_GENERATION && type <= v1::JOB_TYPE_STORY_EXPANSION;
}

// ---------------------------------------------------------------------------
// Job status
// ---------------------------------------------------------------------------

constexpr std::string_view ToString(v1::JobStatus status) {
  switch (status) {
    case v1::JOB_STATUS_PENDING:
      return "pending";
    case v1::JOB_STATUS_PROCESSING:
      return "processing";
    case v1::JOB_STATUS_COMPLETED:
      return "completed";
    case v1::JOB_STATUS_FAILED:
      return "failed";
    case v1::JOB_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

inline std::optional<v1::JobStatus> ParseJobStatus(std::string_view s) {
  for (auto st : {v1::JOB_STATUS_PENDING, v1::JOB_STATUS_PROCESSING, v1::JOB_STATUS_COMPLETED, v1::JOB_STATUS_FAILED, v1::JOB_STATUS_CANCELLED}) {
    if (ToString(st) == s) return st;
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Priority
// ---------------------------------------------------------------------------

constexpr int32_t PriorityWeight(v1::JobPriority priority) {
  switch (priority) {
    case v1::JOB_PRIORITY_LOW:
      return 1;
    case v1::JOB_PRIORITY_HIGH:
      return 10;
    case v1::JOB_PRIORITY_URGENT:
      return 20;
    case v1::JOB_PRIORITY_NORMAL:
    default:
      return 5;
  }
}

// Maps a stored weight back to the nearest tier at or below it.
constexpr v1::JobPriority PriorityFromWeight(int32_t weight) {
  if (weight >= 20) return v1::JOB_PRIORITY_URGENT;
  if (weight >= 10) return v1::JOB_PRIORITY_HIGH;
  if (weight >= 5) return v1::JOB_PRIORITY_NORMAL;
  return v1::JOB_PRIORITY_LOW;
}

// ---------------------------------------------------------------------------
// Subscription tier
// ---------------------------------------------------------------------------

constexpr std::string_view ToString(v1::SubscriptionTier tier) {
  switch (tier) {
    case v1::SUBSCRIPTION_TIER_PRO:
      return "pro";
    case v1::SUBSCRIPTION_TIER_ENTERPRISE:
      return "enterprise";
    case v1::SUBSCRIPTION_TIER_FREE:
    default:
      return "free";
  }
}

inline v1::SubscriptionTier ParseSubscriptionTier(std::string_view s) {
  if (s == "pro") return v1::SUBSCRIPTION_TIER_PRO;
  if (s == "enterprise") return v1::SUBSCRIPTION_TIER_ENTERPRISE;
  return v1::SUBSCRIPTION_TIER_FREE;
}

// Bonus credits attached to an admin subscription grant.
constexpr int64_t TierAllowance(v1::SubscriptionTier tier) {
  switch (tier) {
    case v1::SUBSCRIPTION_TIER_PRO:
      return 500;
    case v1::SUBSCRIPTION_TIER_ENTERPRISE:
      return 2000;
    case v1::SUBSCRIPTION_TIER_FREE:
    default:
      return 100;
  }
}

// ---------------------------------------------------------------------------
// Credit transaction type
// ---------------------------------------------------------------------------

constexpr std::string_view ToString(v1::TransactionType type) {
  switch (type) {
    case v1::TRANSACTION_TYPE_PURCHASE:
      return "purchase";
    case v1::TRANSACTION_TYPE_SUBSCRIPTION:
      return "subscription";
    case v1::TRANSACTION_TYPE_GENERATION:
      return "generation";
    case v1::TRANSACTION_TYPE_REFUND:
      return "refund";
    case v1::TRANSACTION_TYPE_BONUS:
      return "bonus";
    case v1::TRANSACTION_TYPE_ADJUSTMENT:
      return "adjustment";
    default:
      return "unspecified";
  }
}

inline std::optional<v1::TransactionType> ParseTransactionType(std::string_view s) {
  for (auto t : {v1::TRANSACTION_TYPE_PURCHASE, v1::TRANSACTION_TYPE_SUBSCRIPTION, v1::TRANSACTION_TYPE_GENERATION, v1::TRANSACTION_TYPE_REFUND,
                 v1::TRANSACTION_TYPE_BONUS, v1::TRANSACTION_TYPE_ADJUSTMENT}) {
    if (ToString(t) == s) return t;
  }
  return std::nullopt;
}

constexpr bool IsDebitType(v1::TransactionType type) {
  return type == v1::TRANSACTION_TYPE_GENERATION || type == v1::TRANSACTION_TYPE_ADJUSTMENT;
}

constexpr bool IsCreditType(v1::TransactionType type) {
  switch (type) {
    case v1::TRANSACTION_TYPE_PURCHASE:
    case v1::TRANSACTION_TYPE_SUBSCRIPTION:
    case v1::TRANSACTION_TYPE_REFUND:
    case v1::TRANSACTION_TYPE_BONUS:
    case v1::TRANSACTION_TYPE_ADJUSTMENT:
      return true;
    default:
      return false;
  }
}

} // namespace workledger::model
