#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/registry_service.hpp"
#include "settlement/v1/registry_service.grpc.pb.h"

namespace settlement::grpc {

class RegistryServer final : public settlement::v1::RegistryService::Service {
 public:
  explicit RegistryServer(std::shared_ptr<settlement::service::RegistryService> svc);

  ::grpc::Status RegisterPatent(::grpc::ServerContext* ctx, const settlement::v1::RegisterPatentRequest* req, settlement::v1::RegisterPatentResponse* resp) override;
  ::grpc::Status GetPatent(::grpc::ServerContext* ctx, const settlement::v1::GetPatentRequest* req, settlement::v1::GetPatentResponse* resp) override;
  ::grpc::Status ListPatents(::grpc::ServerContext* ctx, const settlement::v1::ListPatentsRequest* req, settlement::v1::ListPatentsResponse* resp) override;
  ::grpc::Status UpdatePatentStatus(::grpc::ServerContext* ctx, const settlement::v1::UpdatePatentStatusRequest* req, settlement::v1::UpdatePatentStatusResponse* resp) override;
  ::grpc::Status EmergencyPause(::grpc::ServerContext* ctx, const settlement::v1::EmergencyRequest* req, settlement::v1::EmergencyResponse* resp) override;
  ::grpc::Status EmergencyResume(::grpc::ServerContext* ctx, const settlement::v1::EmergencyRequest* req, settlement::v1::EmergencyResponse* resp) override;
  ::grpc::Status RequestLicense(::grpc::ServerContext* ctx, const settlement::v1::RequestLicenseRequest* req, settlement::v1::RequestLicenseResponse* resp) override;
  ::grpc::Status ApproveLicense(::grpc::ServerContext* ctx, const settlement::v1::ApproveLicenseRequest* req, settlement::v1::ApproveLicenseResponse* resp) override;
  ::grpc::Status UpdateLicenseStatus(::grpc::ServerContext* ctx, const settlement::v1::UpdateLicenseStatusRequest* req, settlement::v1::UpdateLicenseStatusResponse* resp) override;
  ::grpc::Status GetLicense(::grpc::ServerContext* ctx, const settlement::v1::GetLicenseRequest* req, settlement::v1::GetLicenseResponse* resp) override;
  ::grpc::Status ListLicenses(::grpc::ServerContext* ctx, const settlement::v1::ListLicensesRequest* req, settlement::v1::ListLicensesResponse* resp) override;

 private:
  std::shared_ptr<settlement::service::RegistryService> service_;
};

} // namespace settlement::grpc
