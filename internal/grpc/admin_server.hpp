#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "settlement/v1/admin_service.grpc.pb.h"

namespace settlement::grpc {

class AdminServer final : public settlement::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<settlement::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext* ctx, const settlement::v1::StatsRequest* req, settlement::v1::StatsResponse* resp) override;
  ::grpc::Status ListEvents(::grpc::ServerContext* ctx, const settlement::v1::ListEventsRequest* req, settlement::v1::ListEventsResponse* resp) override;
  ::grpc::Status GetRequest(::grpc::ServerContext* ctx, const settlement::v1::GetRequestRequest* req, settlement::v1::GetRequestResponse* resp) override;
  ::grpc::Status ListRequests(::grpc::ServerContext* ctx, const settlement::v1::ListRequestsRequest* req, settlement::v1::ListRequestsResponse* resp) override;
  ::grpc::Status Deposit(::grpc::ServerContext* ctx, const settlement::v1::DepositRequest* req, settlement::v1::DepositResponse* resp) override;
  ::grpc::Status GetAccount(::grpc::ServerContext* ctx, const settlement::v1::GetAccountRequest* req, settlement::v1::GetAccountResponse* resp) override;
  ::grpc::Status SetAcceptsPayouts(::grpc::ServerContext* ctx, const settlement::v1::SetAcceptsPayoutsRequest* req, settlement::v1::SetAcceptsPayoutsResponse* resp) override;
  ::grpc::Status SealValue(::grpc::ServerContext* ctx, const settlement::v1::SealValueRequest* req, settlement::v1::SealValueResponse* resp) override;
  ::grpc::Status DeliverPending(::grpc::ServerContext* ctx, const settlement::v1::DeliverPendingRequest* req, settlement::v1::DeliverPendingResponse* resp) override;

 private:
  std::shared_ptr<settlement::service::AdminService> service_;
};

} // namespace settlement::grpc
