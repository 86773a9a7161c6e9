#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/royalty_service.hpp"
#include "settlement/v1/royalty_service.grpc.pb.h"

namespace settlement::grpc {

class RoyaltyServer final : public settlement::v1::RoyaltyService::Service {
 public:
  explicit RoyaltyServer(std::shared_ptr<settlement::service::RoyaltyService> svc);

  ::grpc::Status SubmitRoyaltyPayment(::grpc::ServerContext* ctx, const settlement::v1::SubmitRoyaltyPaymentRequest* req, settlement::v1::SubmitRoyaltyPaymentResponse* resp) override;
  ::grpc::Status RequestVerification(::grpc::ServerContext* ctx, const settlement::v1::RequestVerificationRequest* req, settlement::v1::RequestVerificationResponse* resp) override;
  ::grpc::Status GetPayment(::grpc::ServerContext* ctx, const settlement::v1::GetPaymentRequest* req, settlement::v1::GetPaymentResponse* resp) override;
  ::grpc::Status ListPayments(::grpc::ServerContext* ctx, const settlement::v1::ListPaymentsRequest* req, settlement::v1::ListPaymentsResponse* resp) override;

 private:
  std::shared_ptr<settlement::service::RoyaltyService> service_;
};

} // namespace settlement::grpc
