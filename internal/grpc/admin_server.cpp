#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

AdminServer::AdminServer(std::shared_ptr<settlement::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const settlement::v1::StatsRequest* req, settlement::v1::StatsResponse* resp) {
  return Serve([&] { return service_->Stats(*req); }, resp);
}

::grpc::Status AdminServer::ListEvents(::grpc::ServerContext*, const settlement::v1::ListEventsRequest* req, settlement::v1::ListEventsResponse* resp) {
  return Serve([&] { return service_->ListEvents(*req); }, resp);
}

::grpc::Status AdminServer::GetRequest(::grpc::ServerContext*, const settlement::v1::GetRequestRequest* req, settlement::v1::GetRequestResponse* resp) {
  return Serve([&] { return service_->GetRequest(*req); }, resp);
}

::grpc::Status AdminServer::ListRequests(::grpc::ServerContext*, const settlement::v1::ListRequestsRequest* req, settlement::v1::ListRequestsResponse* resp) {
  return Serve([&] { return service_->ListRequests(*req); }, resp);
}

::grpc::Status AdminServer::Deposit(::grpc::ServerContext*, const settlement::v1::DepositRequest* req, settlement::v1::DepositResponse* resp) {
  return Serve([&] { return service_->Deposit(*req); }, resp);
}

::grpc::Status AdminServer::GetAccount(::grpc::ServerContext*, const settlement::v1::GetAccountRequest* req, settlement::v1::GetAccountResponse* resp) {
  return Serve([&] { return service_->GetAccount(*req); }, resp);
}

::grpc::Status AdminServer::SetAcceptsPayouts(::grpc::ServerContext*, const settlement::v1::SetAcceptsPayoutsRequest* req, settlement::v1::SetAcceptsPayoutsResponse* resp) {
  return Serve([&] { return service_->SetAcceptsPayouts(*req); }, resp);
}

::grpc::Status AdminServer::SealValue(::grpc::ServerContext*, const settlement::v1::SealValueRequest* req, settlement::v1::SealValueResponse* resp) {
  return Serve([&] { return service_->SealValue(*req); }, resp);
}

::grpc::Status AdminServer::DeliverPending(::grpc::ServerContext*, const settlement::v1::DeliverPendingRequest* req, settlement::v1::DeliverPendingResponse* resp) {
  return Serve([&] { return service_->DeliverPending(*req); }, resp);
}

} // namespace settlement::grpc
