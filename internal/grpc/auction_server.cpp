#include "auction_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

AuctionServer::AuctionServer(std::shared_ptr<settlement::service::AuctionService> svc) : service_(std::move(svc)) {
}

::grpc::Status AuctionServer::StartBidding(::grpc::ServerContext*, const settlement::v1::StartBiddingRequest* req, settlement::v1::StartBiddingResponse* resp) {
  return Serve([&] { return service_->StartBidding(*req); }, resp);
}

::grpc::Status AuctionServer::SubmitBid(::grpc::ServerContext*, const settlement::v1::SubmitBidRequest* req, settlement::v1::SubmitBidResponse* resp) {
  return Serve([&] { return service_->SubmitBid(*req); }, resp);
}

::grpc::Status AuctionServer::FinalizeBidding(::grpc::ServerContext*, const settlement::v1::FinalizeBiddingRequest* req, settlement::v1::FinalizeBiddingResponse* resp) {
  return Serve([&] { return service_->FinalizeBidding(*req); }, resp);
}

::grpc::Status AuctionServer::GetSession(::grpc::ServerContext*, const settlement::v1::GetSessionRequest* req, settlement::v1::GetSessionResponse* resp) {
  return Serve([&] { return service_->GetSession(*req); }, resp);
}

} // namespace settlement::grpc
