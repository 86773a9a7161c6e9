#pragma once

#include "service_context.hpp"
#include "settlement/v1/admin_service.pb.h"

namespace settlement::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  v1::StatsResponse             Stats(const v1::StatsRequest& req);
  v1::ListEventsResponse        ListEvents(const v1::ListEventsRequest& req);
  v1::GetRequestResponse        GetRequest(const v1::GetRequestRequest& req);
  v1::ListRequestsResponse      ListRequests(const v1::ListRequestsRequest& req);
  v1::DepositResponse           Deposit(const v1::DepositRequest& req);
  v1::GetAccountResponse        GetAccount(const v1::GetAccountRequest& req);
  v1::SetAcceptsPayoutsResponse SetAcceptsPayouts(const v1::SetAcceptsPayoutsRequest& req);
  v1::SealValueResponse         SealValue(const v1::SealValueRequest& req);
  v1::DeliverPendingResponse    DeliverPending(const v1::DeliverPendingRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
