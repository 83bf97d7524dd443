#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "workledger/v1.hpp"

namespace workledger::core {

struct LedgerOptions {
  int64_t default_starting_credits = 100;
};

struct GrantResult {
  v1::AccountCredits credits;
  int64_t            credits_added = 0;
};

struct Reconciliation {
  int64_t cached     = 0;
  int64_t derived    = 0;
  bool    consistent = true;
};

/*
  Credits ledger.

  Mutations run as: lock account row -> check -> update balance ->
  append credit_transactions row -> commit. A rejected call leaves no
  row behind, so
    credits_remaining == starting_credits + sum(amount)
  holds after any sequence of calls.
*/
class CreditsLedger {
 public:
  static constexpr uint32_t kDefaultHistoryLimit = 20;
  static constexpr uint32_t kMaxHistoryLimit     = 500;

  CreditsLedger(std::shared_ptr<db::Repository> repository, LedgerOptions options = {}, util::ClockFn clock = util::Now);

  v1::AccountCredits OpenAccount(const std::string& account_id, std::optional<int64_t> starting_credits = std::nullopt,
                                 v1::SubscriptionTier tier = v1::SUBSCRIPTION_TIER_FREE);

  v1::AccountCredits GetBalance(const std::string& account_id);

  v1::CreditTransaction Debit(const std::string& account_id, int64_t amount, const std::string& description,
                              const std::optional<std::string>& reference_id = std::nullopt,
                              v1::TransactionType               type         = v1::TRANSACTION_TYPE_GENERATION);

  v1::CreditTransaction Credit(const std::string& account_id, int64_t amount, v1::TransactionType type, const std::string& description,
                               const std::optional<std::string>& reference_id = std::nullopt);

  // newest first
  std::vector<v1::CreditTransaction> ListTransactions(const std::string& account_id, uint32_t limit = kDefaultHistoryLimit, uint32_t offset = 0);

  v1::AccountCredits SetSubscription(const std::string& account_id, v1::SubscriptionTier tier, std::optional<util::TimePoint> expires_at,
                                     const std::optional<std::string>& external_subscription_ref = std::nullopt);

  // Tier + expiry + allowance bonus in one transaction.
  GrantResult GrantSubscription(const std::string& account_id, v1::SubscriptionTier tier, v1::GrantDuration duration);

  Reconciliation Reconcile(const std::string& account_id);

 private:
  uint64_t NowMs() const;

  // Caller holds the account lock through tx.
  v1::CreditTransaction ApplyCredit(db::Transaction& tx, db::model::AccountRecord& account, int64_t amount, v1::TransactionType type,
                                    const std::string& description, const std::optional<std::string>& reference_id, uint64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  LedgerOptions                   options_;
  util::ClockFn                   clock_;
};

} // namespace workledger::core
