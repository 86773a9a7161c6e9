#include "refund_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

RefundServer::RefundServer(std::shared_ptr<settlement::service::RefundService> svc) : service_(std::move(svc)) {
}

::grpc::Status RefundServer::ClaimTimeout(::grpc::ServerContext*, const settlement::v1::ClaimTimeoutRequest* req, settlement::v1::ClaimTimeoutResponse* resp) {
  return Serve([&] { return service_->ClaimTimeout(*req); }, resp);
}

::grpc::Status RefundServer::Withdraw(::grpc::ServerContext*, const settlement::v1::WithdrawRequest* req, settlement::v1::WithdrawResponse* resp) {
  return Serve([&] { return service_->Withdraw(*req); }, resp);
}

::grpc::Status RefundServer::Claim(::grpc::ServerContext*, const settlement::v1::ClaimRequest* req, settlement::v1::ClaimResponse* resp) {
  return Serve([&] { return service_->Claim(*req); }, resp);
}

::grpc::Status RefundServer::GetRefundBalance(::grpc::ServerContext*, const settlement::v1::GetRefundBalanceRequest* req, settlement::v1::GetRefundBalanceResponse* resp) {
  return Serve([&] { return service_->GetRefundBalance(*req); }, resp);
}

} // namespace settlement::grpc
