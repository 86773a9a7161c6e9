#pragma once

#include "service_context.hpp"
#include "settlement/v1/refund_service.pb.h"

namespace settlement::service {

class RefundService {
 public:
  explicit RefundService(ServiceContext ctx);

  v1::ClaimTimeoutResponse     ClaimTimeout(const v1::ClaimTimeoutRequest& req);
  v1::WithdrawResponse         Withdraw(const v1::WithdrawRequest& req);
  v1::ClaimResponse            Claim(const v1::ClaimRequest& req);
  v1::GetRefundBalanceResponse GetRefundBalance(const v1::GetRefundBalanceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
