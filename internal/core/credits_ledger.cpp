#include "internal/core/credits_ledger.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>

#include "internal/core/store_errors.hpp"
#include "internal/model/codes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace workledger::core {

using observability::IntField;
using observability::StringField;

namespace {

v1::AccountCredits ToProto(const db::model::AccountRecord& r) {
  v1::AccountCredits out;
  out.set_account_id(r.id);
  out.set_credits_remaining(r.credits_remaining);
  out.set_lifetime_credits_used(r.lifetime_credits_used);
  out.set_subscription_tier(r.subscription_tier);
  if (r.subscription_expires_at_ms) {
    *out.mutable_subscription_expires_at() = util::ToProto(util::FromUnixMillis(*r.subscription_expires_at_ms));
  }
  if (r.external_subscription_ref) out.set_external_subscription_ref(*r.external_subscription_ref);
  return out;
}

v1::CreditTransaction ToProto(const db::model::CreditTransactionRecord& r) {
  v1::CreditTransaction out;
  out.set_id(r.id);
  out.set_account_id(r.account_id);
  out.set_amount(r.amount);
  out.set_transaction_type(r.transaction_type);
  out.set_description(r.description);
  if (r.reference_id) out.set_reference_id(*r.reference_id);
  out.set_balance_after(r.balance_after);
  *out.mutable_created_at() = util::ToProto(util::FromUnixMillis(r.created_at_ms));
  return out;
}

db::model::AccountRecord LockOrThrow(db::Repository& repo, db::Transaction& tx, const std::string& account_id) {
  auto account = repo.LockAccount(tx, account_id);
  if (!account) throw util::UserNotFound("account not found: " + account_id);
  return *account;
}

// Calendar month/year from now; day-of-month clamps to the target month's last day.
uint64_t AddDuration(uint64_t now_ms, v1::GrantDuration duration) {
  using namespace std::chrono;

  const auto tp        = util::FromUnixMillis(now_ms);
  const auto day_start = floor<days>(tp);
  const auto time_of   = tp - day_start;

  year_month_day ymd{day_start};
  if (duration == v1::GRANT_DURATION_YEARLY) {
    ymd += years{1};
  } else {
    ymd += months{1};
  }
  if (!ymd.ok()) {
    ymd = year_month_day{ymd.year() / ymd.month() / last};
  }
  return util::ToUnixMillis(sys_days{ymd} + time_of);
}

} // namespace

CreditsLedger::CreditsLedger(std::shared_ptr<db::Repository> repository, LedgerOptions options, util::ClockFn clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
  if (!repository_) throw std::invalid_argument("CreditsLedger requires a repository");
  if (!clock_) clock_ = util::Now;
}

uint64_t CreditsLedger::NowMs() const {
  return util::ToUnixMillis(clock_());
}

v1::AccountCredits CreditsLedger::OpenAccount(const std::string& account_id, std::optional<int64_t> starting_credits, v1::SubscriptionTier tier) {
  if (account_id.empty()) throw util::InvalidArgument("account_id is required");

  const int64_t starting = starting_credits.value_or(options_.default_starting_credits);
  if (starting < 0) throw util::InvalidAmount("starting credits must be >= 0");

  const uint64_t now = NowMs();

  db::model::AccountRecord r;
  r.id                = account_id;
  r.credits_remaining = starting;
  r.starting_credits  = starting;
  r.subscription_tier = tier == v1::SUBSCRIPTION_TIER_UNSPECIFIED ? v1::SUBSCRIPTION_TIER_FREE : tier;
  r.created_at_ms     = now;
  r.updated_at_ms     = now;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertAccount(*tx, r), "open account");
  tx->Commit();

  WORKLEDGER_LOG_INFO("account opened", {StringField("account_id", account_id), IntField("starting_credits", starting),
                                         StringField("tier", model::ToString(r.subscription_tier))});
  return ToProto(r);
}

v1::AccountCredits CreditsLedger::GetBalance(const std::string& account_id) {
  auto tx      = repository_->Begin();
  auto account = repository_->GetAccount(*tx, account_id);
  tx->Commit();

  if (!account) throw util::UserNotFound("account not found: " + account_id);
  return ToProto(*account);
}

v1::CreditTransaction CreditsLedger::Debit(const std::string& account_id, int64_t amount, const std::string& description,
                                           const std::optional<std::string>& reference_id, v1::TransactionType type) {
  if (amount <= 0) {
    WORKLEDGER_LOG_WARN("debit rejected", {StringField("account_id", account_id), StringField("reason", "invalid_amount"), IntField("amount", amount)});
    throw util::InvalidAmount("debit amount must be > 0");
  }
  if (!model::IsDebitType(type)) {
    throw util::InvalidArgument("transaction type not valid for debit: " + std::string(model::ToString(type)));
  }

  const uint64_t now = NowMs();

  auto tx      = repository_->Begin();
  auto account = LockOrThrow(*repository_, *tx, account_id);

  if (account.credits_remaining < amount) {
    WORKLEDGER_LOG_WARN("debit rejected", {StringField("account_id", account_id), StringField("reason", "insufficient_credits"),
                                           IntField("amount", amount), IntField("available", account.credits_remaining)});
    throw util::InsufficientCredits("insufficient credits", account.credits_remaining, amount);
  }

  account.credits_remaining -= amount;
  account.lifetime_credits_used += amount;
  account.updated_at_ms = now;
  ThrowIfDbError(repository_->UpdateAccount(*tx, account), "debit account");

  db::model::CreditTransactionRecord entry;
  entry.id               = util::NewId();
  entry.account_id       = account_id;
  entry.amount           = -amount;
  entry.transaction_type = type;
  entry.description      = description;
  entry.reference_id     = reference_id;
  entry.balance_after    = account.credits_remaining;
  entry.created_at_ms    = now;
  ThrowIfDbError(repository_->InsertCreditTransaction(*tx, entry), "append debit");

  tx->Commit();

  WORKLEDGER_LOG_INFO("credits debited", {StringField("account_id", account_id), IntField("amount", amount),
                                          IntField("balance_after", entry.balance_after), StringField("reference_id", reference_id.value_or(""))});
  observability::Metrics::Instance().RecordLedgerAmount("debit", amount);
  return ToProto(entry);
}

v1::CreditTransaction CreditsLedger::ApplyCredit(db::Transaction& tx, db::model::AccountRecord& account, int64_t amount, v1::TransactionType type,
                                                 const std::string& description, const std::optional<std::string>& reference_id, uint64_t now_ms) {
  if (account.credits_remaining > std::numeric_limits<int64_t>::max() - amount) {
    throw util::InvalidAmount("credit would overflow the balance");
  }

  account.credits_remaining += amount;
  account.updated_at_ms = now_ms;
  ThrowIfDbError(repository_->UpdateAccount(tx, account), "credit account");

  db::model::CreditTransactionRecord entry;
  entry.id               = util::NewId();
  entry.account_id       = account.id;
  entry.amount           = amount;
  entry.transaction_type = type;
  entry.description      = description;
  entry.reference_id     = reference_id;
  entry.balance_after    = account.credits_remaining;
  entry.created_at_ms    = now_ms;
  ThrowIfDbError(repository_->InsertCreditTransaction(tx, entry), "append credit");

  return ToProto(entry);
}

v1::CreditTransaction CreditsLedger::Credit(const std::string& account_id, int64_t amount, v1::TransactionType type, const std::string& description,
                                            const std::optional<std::string>& reference_id) {
  if (amount <= 0) {
    WORKLEDGER_LOG_WARN("credit rejected", {StringField("account_id", account_id), StringField("reason", "invalid_amount"), IntField("amount", amount)});
    throw util::InvalidAmount("credit amount must be > 0");
  }
  if (!model::IsCreditType(type)) {
    throw util::InvalidArgument("transaction type not valid for credit: " + std::string(model::ToString(type)));
  }

  auto tx      = repository_->Begin();
  auto account = LockOrThrow(*repository_, *tx, account_id);
  auto entry   = ApplyCredit(*tx, account, amount, type, description, reference_id, NowMs());
  tx->Commit();

  WORKLEDGER_LOG_INFO("credits added", {StringField("account_id", account_id), IntField("amount", amount),
                                        StringField("type", model::ToString(type)), IntField("balance_after", entry.balance_after())});
  observability::Metrics::Instance().RecordLedgerAmount("credit", amount);
  return entry;
}

std::vector<v1::CreditTransaction> CreditsLedger::ListTransactions(const std::string& account_id, uint32_t limit, uint32_t offset) {
  db::model::Pagination page;
  page.limit  = std::clamp<uint32_t>(limit, 1, kMaxHistoryLimit);
  page.offset = offset;

  auto tx = repository_->Begin();
  if (!repository_->GetAccount(*tx, account_id)) {
    throw util::UserNotFound("account not found: " + account_id);
  }
  auto rows = repository_->ListCreditTransactions(*tx, account_id, page);
  tx->Commit();

  std::vector<v1::CreditTransaction> out;
  out.reserve(rows.size());
  for (const auto& r : rows) {
    out.push_back(ToProto(r));
  }
  return out;
}

v1::AccountCredits CreditsLedger::SetSubscription(const std::string& account_id, v1::SubscriptionTier tier, std::optional<util::TimePoint> expires_at,
                                                  const std::optional<std::string>& external_subscription_ref) {
  if (tier == v1::SUBSCRIPTION_TIER_UNSPECIFIED) throw util::InvalidArgument("subscription tier is required");

  auto tx      = repository_->Begin();
  auto account = LockOrThrow(*repository_, *tx, account_id);

  account.subscription_tier = tier;
  account.subscription_expires_at_ms.reset();
  if (expires_at) account.subscription_expires_at_ms = util::ToUnixMillis(*expires_at);
  account.external_subscription_ref = external_subscription_ref;
  account.updated_at_ms             = NowMs();

  ThrowIfDbError(repository_->UpdateAccount(*tx, account), "set subscription");
  tx->Commit();

  WORKLEDGER_LOG_INFO("subscription updated", {StringField("account_id", account_id), StringField("tier", model::ToString(tier))});
  return ToProto(account);
}

GrantResult CreditsLedger::GrantSubscription(const std::string& account_id, v1::SubscriptionTier tier, v1::GrantDuration duration) {
  if (tier == v1::SUBSCRIPTION_TIER_UNSPECIFIED) throw util::InvalidArgument("subscription tier is required");
  if (duration != v1::GRANT_DURATION_MONTHLY && duration != v1::GRANT_DURATION_YEARLY) {
    throw util::InvalidArgument("grant duration must be monthly or yearly");
  }

  const uint64_t    now       = NowMs();
  const std::string stamp     = std::to_string(now);
  const int64_t     allowance = model::TierAllowance(tier);
  const char*       period    = duration == v1::GRANT_DURATION_YEARLY ? "yearly" : "monthly";

  auto tx      = repository_->Begin();
  auto account = LockOrThrow(*repository_, *tx, account_id);

  account.subscription_tier          = tier;
  account.subscription_expires_at_ms = AddDuration(now, duration);
  account.external_subscription_ref  = "admin_grant_" + stamp;

  ApplyCredit(*tx, account, allowance, v1::TRANSACTION_TYPE_BONUS,
              "Admin granted " + std::string(model::ToString(tier)) + " " + period + " subscription", "admin_grant_" + account_id + "_" + stamp, now);
  tx->Commit();

  WORKLEDGER_LOG_INFO("subscription granted", {StringField("account_id", account_id), StringField("tier", model::ToString(tier)),
                                               StringField("duration", period), IntField("credits_added", allowance)});
  observability::Metrics::Instance().RecordLedgerAmount("credit", allowance);
  return {ToProto(account), allowance};
}

Reconciliation CreditsLedger::Reconcile(const std::string& account_id) {
  auto tx      = repository_->Begin();
  auto account = LockOrThrow(*repository_, *tx, account_id);
  auto sum     = repository_->SumCreditTransactions(*tx, account_id);
  tx->Commit();

  Reconciliation out;
  out.cached     = account.credits_remaining;
  out.derived    = account.starting_credits + sum;
  out.consistent = out.cached == out.derived;

  if (!out.consistent) {
    WORKLEDGER_LOG_WARN("ledger drift detected", {StringField("account_id", account_id), IntField("cached", out.cached), IntField("derived", out.derived)});
  }
  return out;
}

} // namespace workledger::core
