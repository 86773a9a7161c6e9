#include "refund_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/service/observe_rpc.hpp"

namespace settlement::service {

RefundService::RefundService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// Anyone may push an expired request over the line; caller is only logged.
v1::ClaimTimeoutResponse RefundService::ClaimTimeout(const v1::ClaimTimeoutRequest& req) {
  return ObserveRpc("RefundService.ClaimTimeout", [&] {
    ctx_.engine->ClaimTimeout(req.request_id());
    SETTLEMENT_LOG_INFO("timeout claimed", {observability::IntField("request_id", static_cast<std::int64_t>(req.request_id())),
                                            observability::StringField("caller", req.caller())});
    return v1::ClaimTimeoutResponse{};
  });
}

v1::WithdrawResponse RefundService::Withdraw(const v1::WithdrawRequest& req) {
  return ObserveRpc("RefundService.Withdraw", [&] {
    v1::WithdrawResponse resp;
    resp.set_amount(ctx_.engine->Withdraw(req.caller()));
    return resp;
  });
}

v1::ClaimResponse RefundService::Claim(const v1::ClaimRequest& req) {
  return ObserveRpc("RefundService.Claim", [&] {
    auto result = ctx_.engine->Claim(req.caller(), req.request_id());

    v1::ClaimResponse resp;
    resp.set_withdrawn(result.withdrawn);
    resp.set_withdraw_error(result.withdraw_error);
    return resp;
  });
}

v1::GetRefundBalanceResponse RefundService::GetRefundBalance(const v1::GetRefundBalanceRequest& req) {
  return ObserveRpc("RefundService.GetRefundBalance", [&] {
    v1::GetRefundBalanceResponse resp;
    resp.set_amount(ctx_.engine->RefundBalanceOf(req.account()));
    return resp;
  });
}

} // namespace settlement::service
