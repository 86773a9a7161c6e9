#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/auction_server.hpp"
#include "internal/grpc/oracle_callback_server.hpp"
#include "internal/grpc/refund_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/auction_service.hpp"
#include "internal/service/oracle_callback_service.hpp"
#include "internal/service/refund_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#include "settlement/v1.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using settlement::testing::EngineFixture;
namespace v1 = settlement::v1;

settlement::service::ServiceContext BuildServiceContext(const EngineFixture& f) {
  settlement::service::ServiceContext ctx;
  ctx.engine       = f.engine;
  ctx.local_oracle = f.local_oracle;
  return ctx;
}

void TestGetMissingPatentReturnsNotFound() {
  EngineFixture f;
  settlement::grpc::RegistryServer server(std::make_shared<settlement::service::RegistryService>(BuildServiceContext(f)));

  v1::GetPatentRequest req;
  req.set_patent_id(42);
  v1::GetPatentResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetPatent(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestPauseByNonOperatorReturnsPermissionDenied() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  settlement::grpc::RegistryServer server(std::make_shared<settlement::service::RegistryService>(BuildServiceContext(f)));

  v1::EmergencyRequest req;
  req.set_caller("owner");
  req.set_patent_id(patent);
  v1::EmergencyResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.EmergencyPause(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  req.set_caller(settlement::testing::kOperator);
  ::grpc::ServerContext ok_ctx;
  assert(server.EmergencyPause(&ok_ctx, &req, &resp).ok());
}

void TestBadDurationReturnsInvalidArgument() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  settlement::grpc::AuctionServer server(std::make_shared<settlement::service::AuctionService>(BuildServiceContext(f)));

  v1::StartBiddingRequest req;
  req.set_caller("owner");
  req.set_asset_id(patent);
  req.set_duration_hours(0);
  v1::StartBiddingResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.StartBidding(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestWithdrawWithoutBalanceReturnsFailedPrecondition() {
  EngineFixture f;
  settlement::grpc::RefundServer server(std::make_shared<settlement::service::RefundService>(BuildServiceContext(f)));

  v1::WithdrawRequest req;
  req.set_caller("nobody");
  v1::WithdrawResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Withdraw(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestRejectedPayoutReturnsAborted() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  f.Fund("alice", 100);
  f.Fund("bob", 100);
  f.engine->StartBidding("owner", patent, 1);
  f.Bid("alice", patent, 5, 10);
  f.Bid("bob", patent, 3, 20);
  f.EndWindow();
  f.Deliver(f.engine->FinalizeBidding("owner", patent));
  assert(f.engine->RefundBalanceOf("bob") == 20);

  f.engine->SetAcceptsPayouts("bob", false);
  settlement::grpc::RefundServer server(std::make_shared<settlement::service::RefundService>(BuildServiceContext(f)));

  v1::WithdrawRequest req;
  req.set_caller("bob");
  v1::WithdrawResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Withdraw(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
  assert(f.engine->RefundBalanceOf("bob") == 20);
  f.ExpectBalanced();
}

void TestForgedCallbackReturnsUnauthenticated() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  f.Fund("alice", 100);
  f.engine->StartBidding("owner", patent, 1);
  f.Bid("alice", patent, 5, 10);
  f.EndWindow();
  const auto id = f.engine->FinalizeBidding("owner", patent);

  settlement::grpc::OracleCallbackServer server(std::make_shared<settlement::service::OracleCallbackService>(BuildServiceContext(f)));

  auto signed_words = f.Sign(id, {5});
  signed_words.proof[0] ^= 0x01;

  v1::CompleteRequest req;
  req.set_request_id(id);
  req.set_cleartexts(signed_words.cleartexts);
  req.set_proof(signed_words.proof);
  v1::CompleteResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.CompleteBidding(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  // the failure committed: the bidder is refunded and a second answer is refused
  assert(f.engine->GetRequest(id).status == settlement::model::RequestStatus::kFailed);
  assert(f.engine->RefundBalanceOf("alice") == 10);

  ::grpc::ServerContext again_ctx;
  assert(server.CompleteBidding(&again_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestAdminEventsAndDelivery() {
  EngineFixture f;
  for (int i = 0; i < 1005; ++i) {
    f.Fund("alice", 1);
  }

  auto ctx = BuildServiceContext(f);
  settlement::grpc::AdminServer server(std::make_shared<settlement::service::AdminService>(ctx));

  v1::ListEventsRequest events_req;
  events_req.set_limit(5000);
  v1::ListEventsResponse events_resp;
  ::grpc::ServerContext  events_ctx;
  assert(server.ListEvents(&events_ctx, &events_req, &events_resp).ok());
  assert(events_resp.events_size() == 1000);

  events_req.set_limit(0);
  events_req.set_after_sequence(1000);
  ::grpc::ServerContext tail_ctx;
  assert(server.ListEvents(&tail_ctx, &events_req, &events_resp).ok());
  assert(events_resp.events_size() == 5);

  v1::DeliverPendingRequest deliver_req;
  v1::DeliverPendingResponse deliver_resp;
  ::grpc::ServerContext      deliver_ctx;
  assert(server.DeliverPending(&deliver_ctx, &deliver_req, &deliver_resp).ok());
  assert(deliver_resp.delivered() == 0);

  ctx.local_oracle = nullptr;
  settlement::grpc::AdminServer external(std::make_shared<settlement::service::AdminService>(ctx));
  ::grpc::ServerContext         external_ctx;
  assert(external.DeliverPending(&external_ctx, &deliver_req, &deliver_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

} // namespace

int main() {
  TestGetMissingPatentReturnsNotFound();
  TestPauseByNonOperatorReturnsPermissionDenied();
  TestBadDurationReturnsInvalidArgument();
  TestWithdrawWithoutBalanceReturnsFailedPrecondition();
  TestRejectedPayoutReturnsAborted();
  TestForgedCallbackReturnsUnauthenticated();
  TestAdminEventsAndDelivery();

  std::cout << "settlement_unit_grpc_status: pass\n";
  return 0;
}
