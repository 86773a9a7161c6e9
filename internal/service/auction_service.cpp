#include "auction_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"

namespace settlement::service {

AuctionService::AuctionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::StartBiddingResponse AuctionService::StartBidding(const v1::StartBiddingRequest& req) {
  return ObserveRpc("AuctionService.StartBidding", [&] {
    v1::StartBiddingResponse resp;
    *resp.mutable_session() = ToProto(ctx_.engine->StartBidding(req.caller(), req.asset_id(), req.duration_hours()));
    return resp;
  });
}

v1::SubmitBidResponse AuctionService::SubmitBid(const v1::SubmitBidRequest& req) {
  return ObserveRpc("AuctionService.SubmitBid", [&] {
    v1::SubmitBidResponse resp;
    resp.set_bid_index(ctx_.engine->SubmitBid(req.caller(), req.asset_id(), req.encrypted_amount(), req.escrow()));
    return resp;
  });
}

v1::FinalizeBiddingResponse AuctionService::FinalizeBidding(const v1::FinalizeBiddingRequest& req) {
  return ObserveRpc("AuctionService.FinalizeBidding", [&] {
    v1::FinalizeBiddingResponse resp;
    resp.set_request_id(ctx_.engine->FinalizeBidding(req.caller(), req.asset_id()));
    return resp;
  });
}

v1::GetSessionResponse AuctionService::GetSession(const v1::GetSessionRequest& req) {
  return ObserveRpc("AuctionService.GetSession", [&] {
    v1::GetSessionResponse resp;
    *resp.mutable_session() = ToProto(ctx_.engine->GetSession(req.asset_id()));
    return resp;
  });
}

} // namespace settlement::service
