#pragma once

#include "service_context.hpp"
#include "workledger/v1.hpp"

namespace workledger::service {

class LedgerService {
 public:
  explicit LedgerService(ServiceContext ctx);

  v1::OpenAccountResponse       OpenAccount(const v1::OpenAccountRequest& req);
  v1::GetBalanceResponse        GetBalance(const v1::GetBalanceRequest& req);
  v1::DebitResponse             Debit(const v1::DebitRequest& req);
  v1::CreditResponse            Credit(const v1::CreditRequest& req);
  v1::ListTransactionsResponse  ListTransactions(const v1::ListTransactionsRequest& req);
  v1::SetSubscriptionResponse   SetSubscription(const v1::SetSubscriptionRequest& req);
  v1::GrantSubscriptionResponse GrantSubscription(const v1::GrantSubscriptionRequest& req);
  v1::ReconcileResponse         Reconcile(const v1::ReconcileRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace workledger::service
