#include "oracle_callback_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"

namespace settlement::service {

namespace {

v1::CompleteResponse ToResponse(const core::CompletionResult& result) {
  v1::CompleteResponse resp;
  resp.set_status(ToProto(result.status));
  resp.set_failure_reason(result.failure_reason);
  return resp;
}

} // namespace

OracleCallbackService::OracleCallbackService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::CompleteResponse OracleCallbackService::CompleteBidding(const v1::CompleteRequest& req) {
  return ObserveRpc("OracleCallbackService.CompleteBidding",
                    [&] { return ToResponse(ctx_.engine->CompleteBidding(req.request_id(), req.cleartexts(), req.proof())); });
}

v1::CompleteResponse OracleCallbackService::CompleteVerification(const v1::CompleteRequest& req) {
  return ObserveRpc("OracleCallbackService.CompleteVerification",
                    [&] { return ToResponse(ctx_.engine->CompleteVerification(req.request_id(), req.cleartexts(), req.proof())); });
}

} // namespace settlement::service
