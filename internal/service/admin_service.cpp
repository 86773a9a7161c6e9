#include "admin_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/oracle/local_oracle.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/errors.hpp"

namespace settlement::service {

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::StatsResponse AdminService::Stats(const v1::StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    auto stats = ctx_.engine->Stats();

    v1::StatsResponse resp;
    resp.set_requests_pending(stats.requests_pending);
    resp.set_requests_completed(stats.requests_completed);
    resp.set_requests_failed(stats.requests_failed);
    resp.set_requests_timed_out(stats.requests_timed_out);
    resp.set_custody_balance(stats.custody);
    resp.set_active_escrow(stats.active_escrow);
    resp.set_refundable_total(stats.refundable);
    resp.set_balanced(stats.balanced);
    resp.set_sessions(stats.sessions);
    return resp;
  });
}

v1::ListEventsResponse AdminService::ListEvents(const v1::ListEventsRequest& req) {
  return ObserveRpc("AdminService.ListEvents", [&] {
    v1::ListEventsResponse resp;
    for (const auto& event : ctx_.engine->ListEvents(req.after_sequence(), req.limit())) {
      *resp.add_events() = ToProto(event);
    }
    return resp;
  });
}

v1::GetRequestResponse AdminService::GetRequest(const v1::GetRequestRequest& req) {
  return ObserveRpc("AdminService.GetRequest", [&] {
    v1::GetRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.engine->GetRequest(req.request_id()));
    return resp;
  });
}

v1::ListRequestsResponse AdminService::ListRequests(const v1::ListRequestsRequest& req) {
  return ObserveRpc("AdminService.ListRequests", [&] {
    v1::ListRequestsResponse resp;
    for (const auto& request : ctx_.engine->ListRequests(FromProto(req.status()))) {
      *resp.add_requests() = ToProto(request);
    }
    return resp;
  });
}

v1::DepositResponse AdminService::Deposit(const v1::DepositRequest& req) {
  return ObserveRpc("AdminService.Deposit", [&] {
    v1::DepositResponse resp;
    resp.set_balance(ctx_.engine->Deposit(req.account(), req.amount()));
    return resp;
  });
}

v1::GetAccountResponse AdminService::GetAccount(const v1::GetAccountRequest& req) {
  return ObserveRpc("AdminService.GetAccount", [&] {
    auto view = ctx_.engine->GetAccount(req.account());

    v1::GetAccountResponse resp;
    resp.set_balance(view.balance);
    resp.set_accepts_payouts(view.accepts_payouts);
    resp.set_refundable(view.refundable);
    return resp;
  });
}

v1::SetAcceptsPayoutsResponse AdminService::SetAcceptsPayouts(const v1::SetAcceptsPayoutsRequest& req) {
  return ObserveRpc("AdminService.SetAcceptsPayouts", [&] {
    ctx_.engine->SetAcceptsPayouts(req.account(), req.accepts_payouts());
    return v1::SetAcceptsPayoutsResponse{};
  });
}

v1::SealValueResponse AdminService::SealValue(const v1::SealValueRequest& req) {
  return ObserveRpc("AdminService.SealValue", [&] {
    v1::SealValueResponse resp;
    resp.set_handle(ctx_.engine->SealValue(req.value()));
    return resp;
  });
}

v1::DeliverPendingResponse AdminService::DeliverPending(const v1::DeliverPendingRequest& req) {
  return ObserveRpc("AdminService.DeliverPending", [&] {
    if (!ctx_.local_oracle) throw util::InvalidState("no local oracle configured");

    v1::DeliverPendingResponse resp;
    resp.set_delivered(ctx_.local_oracle->DeliverPending(req.request_id()));
    return resp;
  });
}

} // namespace settlement::service
