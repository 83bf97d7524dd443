#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/ledger_service.hpp"
#include "workledger/v1.hpp"

namespace workledger::grpc {

class LedgerServer final : public v1::LedgerService::Service {
 public:
  explicit LedgerServer(std::shared_ptr<workledger::service::LedgerService> svc);

  ::grpc::Status OpenAccount(::grpc::ServerContext*, const v1::OpenAccountRequest*, v1::OpenAccountResponse*) override;
  ::grpc::Status GetBalance(::grpc::ServerContext*, const v1::GetBalanceRequest*, v1::GetBalanceResponse*) override;
  ::grpc::Status Debit(::grpc::ServerContext*, const v1::DebitRequest*, v1::DebitResponse*) override;
  ::grpc::Status Credit(::grpc::ServerContext*, const v1::CreditRequest*, v1::CreditResponse*) override;
  ::grpc::Status ListTransactions(::grpc::ServerContext*, const v1::ListTransactionsRequest*, v1::ListTransactionsResponse*) override;
  ::grpc::Status SetSubscription(::grpc::ServerContext*, const v1::SetSubscriptionRequest*, v1::SetSubscriptionResponse*) override;
  ::grpc::Status GrantSubscription(::grpc::ServerContext*, const v1::GrantSubscriptionRequest*, v1::GrantSubscriptionResponse*) override;
  ::grpc::Status Reconcile(::grpc::ServerContext*, const v1::ReconcileRequest*, v1::ReconcileResponse*) override;

 private:
  std::shared_ptr<workledger::service::LedgerService> service_;
};

} // namespace workledger::grpc
