#pragma once

#include "service_context.hpp"
#include "settlement/v1/auction_service.pb.h"

namespace settlement::service {

class AuctionService {
 public:
  explicit AuctionService(ServiceContext ctx);

  v1::StartBiddingResponse    StartBidding(const v1::StartBiddingRequest& req);
  v1::SubmitBidResponse       SubmitBid(const v1::SubmitBidRequest& req);
  v1::FinalizeBiddingResponse FinalizeBidding(const v1::FinalizeBiddingRequest& req);
  v1::GetSessionResponse      GetSession(const v1::GetSessionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
