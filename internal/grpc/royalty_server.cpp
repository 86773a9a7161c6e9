#include "royalty_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

RoyaltyServer::RoyaltyServer(std::shared_ptr<settlement::service::RoyaltyService> svc) : service_(std::move(svc)) {
}

::grpc::Status RoyaltyServer::SubmitRoyaltyPayment(::grpc::ServerContext*, const settlement::v1::SubmitRoyaltyPaymentRequest* req, settlement::v1::SubmitRoyaltyPaymentResponse* resp) {
  return Serve([&] { return service_->SubmitRoyaltyPayment(*req); }, resp);
}

::grpc::Status RoyaltyServer::RequestVerification(::grpc::ServerContext*, const settlement::v1::RequestVerificationRequest* req, settlement::v1::RequestVerificationResponse* resp) {
  return Serve([&] { return service_->RequestVerification(*req); }, resp);
}

::grpc::Status RoyaltyServer::GetPayment(::grpc::ServerContext*, const settlement::v1::GetPaymentRequest* req, settlement::v1::GetPaymentResponse* resp) {
  return Serve([&] { return service_->GetPayment(*req); }, resp);
}

::grpc::Status RoyaltyServer::ListPayments(::grpc::ServerContext*, const settlement::v1::ListPaymentsRequest* req, settlement::v1::ListPaymentsResponse* resp) {
  return Serve([&] { return service_->ListPayments(*req); }, resp);
}

} // namespace settlement::grpc
