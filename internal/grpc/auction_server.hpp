#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/auction_service.hpp"
#include "settlement/v1/auction_service.grpc.pb.h"

namespace settlement::grpc {

class AuctionServer final : public settlement::v1::AuctionService::Service {
 public:
  explicit AuctionServer(std::shared_ptr<settlement::service::AuctionService> svc);

  ::grpc::Status StartBidding(::grpc::ServerContext* ctx, const settlement::v1::StartBiddingRequest* req, settlement::v1::StartBiddingResponse* resp) override;
  ::grpc::Status SubmitBid(::grpc::ServerContext* ctx, const settlement::v1::SubmitBidRequest* req, settlement::v1::SubmitBidResponse* resp) override;
  ::grpc::Status FinalizeBidding(::grpc::ServerContext* ctx, const settlement::v1::FinalizeBiddingRequest* req, settlement::v1::FinalizeBiddingResponse* resp) override;
  ::grpc::Status GetSession(::grpc::ServerContext* ctx, const settlement::v1::GetSessionRequest* req, settlement::v1::GetSessionResponse* resp) override;

 private:
  std::shared_ptr<settlement::service::AuctionService> service_;
};

} // namespace settlement::grpc
