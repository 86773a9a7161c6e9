#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/refund_service.hpp"
#include "settlement/v1/refund_service.grpc.pb.h"

namespace settlement::grpc {

class RefundServer final : public settlement::v1::RefundService::Service {
 public:
  explicit RefundServer(std::shared_ptr<settlement::service::RefundService> svc);

  ::grpc::Status ClaimTimeout(::grpc::ServerContext* ctx, const settlement::v1::ClaimTimeoutRequest* req, settlement::v1::ClaimTimeoutResponse* resp) override;
  ::grpc::Status Withdraw(::grpc::ServerContext* ctx, const settlement::v1::WithdrawRequest* req, settlement::v1::WithdrawResponse* resp) override;
  ::grpc::Status Claim(::grpc::ServerContext* ctx, const settlement::v1::ClaimRequest* req, settlement::v1::ClaimResponse* resp) override;
  ::grpc::Status GetRefundBalance(::grpc::ServerContext* ctx, const settlement::v1::GetRefundBalanceRequest* req, settlement::v1::GetRefundBalanceResponse* resp) override;

 private:
  std::shared_ptr<settlement::service::RefundService> service_;
};

} // namespace settlement::grpc
