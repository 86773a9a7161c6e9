#include "registry_server.hpp"

#include "grpc_error.hpp"

namespace settlement::grpc {

RegistryServer::RegistryServer(std::shared_ptr<settlement::service::RegistryService> svc) : service_(std::move(svc)) {
}

::grpc::Status RegistryServer::RegisterPatent(::grpc::ServerContext*, const settlement::v1::RegisterPatentRequest* req, settlement::v1::RegisterPatentResponse* resp) {
  return Serve([&] { return service_->RegisterPatent(*req); }, resp);
}

::grpc::Status RegistryServer::GetPatent(::grpc::ServerContext*, const settlement::v1::GetPatentRequest* req, settlement::v1::GetPatentResponse* resp) {
  return Serve([&] { return service_->GetPatent(*req); }, resp);
}

::grpc::Status RegistryServer::ListPatents(::grpc::ServerContext*, const settlement::v1::ListPatentsRequest* req, settlement::v1::ListPatentsResponse* resp) {
  return Serve([&] { return service_->ListPatents(*req); }, resp);
}

::grpc::Status RegistryServer::UpdatePatentStatus(::grpc::ServerContext*, const settlement::v1::UpdatePatentStatusRequest* req, settlement::v1::UpdatePatentStatusResponse* resp) {
  return Serve([&] { return service_->UpdatePatentStatus(*req); }, resp);
}

::grpc::Status RegistryServer::EmergencyPause(::grpc::ServerContext*, const settlement::v1::EmergencyRequest* req, settlement::v1::EmergencyResponse* resp) {
  return Serve([&] { return service_->EmergencyPause(*req); }, resp);
}

::grpc::Status RegistryServer::EmergencyResume(::grpc::ServerContext*, const settlement::v1::EmergencyRequest* req, settlement::v1::EmergencyResponse* resp) {
  return Serve([&] { return service_->EmergencyResume(*req); }, resp);
}

::grpc::Status RegistryServer::RequestLicense(::grpc::ServerContext*, const settlement::v1::RequestLicenseRequest* req, settlement::v1::RequestLicenseResponse* resp) {
  return Serve([&] { return service_->RequestLicense(*req); }, resp);
}

::grpc::Status RegistryServer::ApproveLicense(::grpc::ServerContext*, const settlement::v1::ApproveLicenseRequest* req, settlement::v1::ApproveLicenseResponse* resp) {
  return Serve([&] { return service_->ApproveLicense(*req); }, resp);
}

::grpc::Status RegistryServer::UpdateLicenseStatus(::grpc::ServerContext*, const settlement::v1::UpdateLicenseStatusRequest* req, settlement::v1::UpdateLicenseStatusResponse* resp) {
  return Serve([&] { return service_->UpdateLicenseStatus(*req); }, resp);
}

::grpc::Status RegistryServer::GetLicense(::grpc::ServerContext*, const settlement::v1::GetLicenseRequest* req, settlement::v1::GetLicenseResponse* resp) {
  return Serve([&] { return service_->GetLicense(*req); }, resp);
}

::grpc::Status RegistryServer::ListLicenses(::grpc::ServerContext*, const settlement::v1::ListLicensesRequest* req, settlement::v1::ListLicensesResponse* resp) {
  return Serve([&] { return service_->ListLicenses(*req); }, resp);
}

} // namespace settlement::grpc
