#include "ledger_service.hpp"

#include <stdexcept>

#include "internal/core/credits_ledger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace workledger::service {

namespace {

std::optional<std::string> OptionalRef(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

void RequireAccount(const std::string& account_id) {
  if (account_id.empty()) throw util::InvalidArgument("account_id is required");
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.ledger) throw std::invalid_argument("LedgerService requires a credits ledger");
}

v1::OpenAccountResponse LedgerService::OpenAccount(const v1::OpenAccountRequest& req) {
  return ObserveRpc("LedgerService.OpenAccount", "account_id", req.account_id(), [&] {
    RequireAccount(req.account_id());
    std::optional<int64_t> starting;
    if (req.has_starting_credits()) starting = req.starting_credits();

    v1::OpenAccountResponse resp;
    *resp.mutable_credits() = ctx_.ledger->OpenAccount(req.account_id(), starting, req.tier());
    return resp;
  });
}

v1::GetBalanceResponse LedgerService::GetBalance(const v1::GetBalanceRequest& req) {
  return ObserveRpc("LedgerService.GetBalance", "account_id", req.account_id(), [&] {
    RequireAccount(req.account_id());
    v1::GetBalanceResponse resp;
    *resp.mutable_credits() = ctx_.ledger->GetBalance(req.account_id());
    return resp;
  });
}

v1::DebitResponse LedgerService::Debit(const v1::DebitRequest& req) {
  return ObserveRpc("LedgerService.Debit", "account_id", req.account_id(), [&] {
    RequireAccount(req.account_id());
    const auto type = req.transaction_type() == v1::TRANSACTION_TYPE_UNSPECIFIED ? v1::TRANSACTION_TYPE_GENERATION : req.transaction_type();

    v1::DebitResponse resp;
    *resp.mutable_transaction() = ctx_.ledger->Debit(req.account_id(), req.amount(), req.description(), OptionalRef(req.reference_id()), type);
    resp.set_credits_remaining(resp.transaction().balance_after());
    return resp;
  });
}

v1::CreditResponse LedgerService::Credit(const v1::CreditRequest& req) {
  return ObserveRpc("LedgerService.Credit", "account_id", req.account_id(), [&] {
    RequireAccount(req.account_id());
    if (req.transaction_type() == v1::TRANSACTION_TYPE_UNSPECIFIED) throw util::InvalidArgument("transaction_type is required");

    v1::CreditResponse resp;
    *resp.mutable_transaction() =
        ctx_.ledger->Credit(req.account_id(), req.amount(), req.transaction_type(), req.description(), OptionalRef(req.reference_id()));
    resp.set_credits_remaining(resp.transaction().balance_after());
    return resp;
  });
}

v1::ListTransactionsResponse LedgerService::ListTransactions(const v1::ListTransactionsRequest& req) {
  return ObserveRpc("LedgerService.ListTransactions", "account_id", req.account_id(), [&] {
    RequireAccount(req.account_id());
    const uint32_t limit = req.limit() == 0 ? core::CreditsLedger::kDefaultHistoryLimit : req.limit();

    v1::ListTransactionsResponse resp;
    for (auto& entry : ctx_.ledger->ListTransactions(req.account_id(), limit, req.offset())) {
      *resp.add_transactions() = std::move(entry);
    }
    return resp;
  });
}

v1::SetSubscriptionResponse LedgerService::SetSubscription(const v1::SetSubscriptionRequest& req) {
  return ObserveRpc("LedgerService.SetSubscription", "account_id", req.account_id(), [&] {
    RequireAccount(req.account_id());
    std::optional<util::TimePoint> expires;
    if (req.has_expires_at()) expires = util::FromProto(req.expires_at());

    v1::SetSubscriptionResponse resp;
    *resp.mutable_credits() = ctx_.ledger->SetSubscription(req.account_id(), req.tier(), expires, OptionalRef(req.external_subscription_ref()));
    return resp;
  });
}

v1::GrantSubscriptionResponse LedgerService::GrantSubscription(const v1::GrantSubscriptionRequest& req) {
  return ObserveRpc("LedgerService.GrantSubscription", "account_id", req.account_id(), [&] {
    RequireAccount(req.account_id());
    const auto duration = req.duration() == v1::GRANT_DURATION_UNSPECIFIED ? v1::GRANT_DURATION_MONTHLY : req.duration();
    auto       granted  = ctx_.ledger->GrantSubscription(req.account_id(), req.tier(), duration);

    v1::GrantSubscriptionResponse resp;
    *resp.mutable_credits() = std::move(granted.credits);
    resp.set_credits_added(granted.credits_added);
    return resp;
  });
}

v1::ReconcileResponse LedgerService::Reconcile(const v1::ReconcileRequest& req) {
  return ObserveRpc("LedgerService.Reconcile", "account_id", req.account_id(), [&] {
    RequireAccount(req.account_id());
    const auto result = ctx_.ledger->Reconcile(req.account_id());

    v1::ReconcileResponse resp;
    resp.set_cached_balance(result.cached);
    resp.set_derived_balance(result.derived);
    resp.set_consistent(result.consistent);
    return resp;
  });
}

} // namespace workledger::service
