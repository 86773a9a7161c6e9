#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/oracle_callback_service.hpp"
#include "settlement/v1/oracle_callback_service.grpc.pb.h"

namespace settlement::grpc {

class OracleCallbackServer final : public settlement::v1::OracleCallbackService::Service {
 public:
  explicit OracleCallbackServer(std::shared_ptr<settlement::service::OracleCallbackService> svc);

  ::grpc::Status CompleteBidding(::grpc::ServerContext* ctx, const settlement::v1::CompleteRequest* req, settlement::v1::CompleteResponse* resp) override;
  ::grpc::Status CompleteVerification(::grpc::ServerContext* ctx, const settlement::v1::CompleteRequest* req, settlement::v1::CompleteResponse* resp) override;

 private:
  std::shared_ptr<settlement::service::OracleCallbackService> service_;
};

} // namespace settlement::grpc
