#include "royalty_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"

namespace settlement::service {

RoyaltyService::RoyaltyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::SubmitRoyaltyPaymentResponse RoyaltyService::SubmitRoyaltyPayment(const v1::SubmitRoyaltyPaymentRequest& req) {
  return ObserveRpc("RoyaltyService.SubmitRoyaltyPayment", [&] {
    v1::SubmitRoyaltyPaymentResponse resp;
    resp.set_payment_index(
        ctx_.engine->SubmitRoyaltyPayment(req.caller(), req.license_id(), req.revenue_handle(), req.amount(), req.reporting_period()));
    return resp;
  });
}

v1::RequestVerificationResponse RoyaltyService::RequestVerification(const v1::RequestVerificationRequest& req) {
  return ObserveRpc("RoyaltyService.RequestVerification", [&] {
    v1::RequestVerificationResponse resp;
    resp.set_request_id(ctx_.engine->RequestVerification(req.caller(), req.license_id(), req.payment_index()));
    return resp;
  });
}

v1::GetPaymentResponse RoyaltyService::GetPayment(const v1::GetPaymentRequest& req) {
  return ObserveRpc("RoyaltyService.GetPayment", [&] {
    v1::GetPaymentResponse resp;
    *resp.mutable_payment() = ToProto(ctx_.engine->GetPayment(req.license_id(), req.payment_index()));
    return resp;
  });
}

v1::ListPaymentsResponse RoyaltyService::ListPayments(const v1::ListPaymentsRequest& req) {
  return ObserveRpc("RoyaltyService.ListPayments", [&] {
    v1::ListPaymentsResponse resp;
    for (const auto& payment : ctx_.engine->ListPayments(req.license_id())) {
      *resp.add_payments() = ToProto(payment);
    }
    return resp;
  });
}

} // namespace settlement::service
