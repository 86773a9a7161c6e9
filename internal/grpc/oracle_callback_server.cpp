#include "oracle_callback_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

OracleCallbackServer::OracleCallbackServer(std::shared_ptr<settlement::service::OracleCallbackService> svc) : service_(std::move(svc)) {
}

::grpc::Status OracleCallbackServer::CompleteBidding(::grpc::ServerContext*, const settlement::v1::CompleteRequest* req, settlement::v1::CompleteResponse* resp) {
  return Serve([&] { return service_->CompleteBidding(*req); }, resp);
}

::grpc::Status OracleCallbackServer::CompleteVerification(::grpc::ServerContext*, const settlement::v1::CompleteRequest* req, settlement::v1::CompleteResponse* resp) {
  return Serve([&] { return service_->CompleteVerification(*req); }, resp);
}

} // namespace settlement::grpc
