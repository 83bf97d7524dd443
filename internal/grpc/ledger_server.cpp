#include "ledger_server.hpp"

#include <stdexcept>

#include "grpc_error.hpp"

namespace workledger::grpc {

LedgerServer::LedgerServer(std::shared_ptr<workledger::service::LedgerService> svc) : service_(std::move(svc)) {
  if (!service_) throw std::invalid_argument("LedgerServer requires a service");
}

::grpc::Status LedgerServer::OpenAccount(::grpc::ServerContext*, const v1::OpenAccountRequest* req, v1::OpenAccountResponse* resp) {
  try {
    *resp = service_->OpenAccount(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetBalance(::grpc::ServerContext*, const v1::GetBalanceRequest* req, v1::GetBalanceResponse* resp) {
  try {
    *resp = service_->GetBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Debit(::grpc::ServerContext*, const v1::DebitRequest* req, v1::DebitResponse* resp) {
  try {
    *resp = service_->Debit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Credit(::grpc::ServerContext*, const v1::CreditRequest* req, v1::CreditResponse* resp) {
  try {
    *resp = service_->Credit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ListTransactions(::grpc::ServerContext*, const v1::ListTransactionsRequest* req, v1::ListTransactionsResponse* resp) {
  try {
    *resp = service_->ListTransactions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::SetSubscription(::grpc::ServerContext*, const v1::SetSubscriptionRequest* req, v1::SetSubscriptionResponse* resp) {
  try {
    *resp = service_->SetSubscription(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GrantSubscription(::grpc::ServerContext*, const v1::GrantSubscriptionRequest* req, v1::GrantSubscriptionResponse* resp) {
  try {
    *resp = service_->GrantSubscription(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Reconcile(::grpc::ServerContext*, const v1::ReconcileRequest* req, v1::ReconcileResponse* resp) {
  try {
    *resp = service_->Reconcile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace workledger::grpc
