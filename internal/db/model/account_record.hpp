#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "workledger/v1.hpp"

namespace workledger::db::model {

/*
  Ledger projection of an account.

  credits_remaining is a cached balance; the transaction log is
  authoritative: credits_remaining == starting_credits + sum(amount).
*/

struct AccountRecord {
  std::string id;

  int64_t credits_remaining     = 0;
  int64_t starting_credits      = 0;
  int64_t lifetime_credits_used = 0;

  v1::SubscriptionTier       subscription_tier = v1::SUBSCRIPTION_TIER_FREE;
  std::optional<uint64_t>    subscription_expires_at_ms;
  std::optional<std::string> external_subscription_ref;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace workledger::db::model
