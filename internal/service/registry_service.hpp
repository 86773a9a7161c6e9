#pragma once

#include "service_context.hpp"
#include "settlement/v1/registry_service.pb.h"

namespace settlement::service {

class RegistryService {
 public:
  explicit RegistryService(ServiceContext ctx);

  v1::RegisterPatentResponse      RegisterPatent(const v1::RegisterPatentRequest& req);
  v1::GetPatentResponse           GetPatent(const v1::GetPatentRequest& req);
  v1::ListPatentsResponse         ListPatents(const v1::ListPatentsRequest& req);
  v1::UpdatePatentStatusResponse  UpdatePatentStatus(const v1::UpdatePatentStatusRequest& req);
  v1::EmergencyResponse           EmergencyPause(const v1::EmergencyRequest& req);
  v1::EmergencyResponse           EmergencyResume(const v1::EmergencyRequest& req);
  v1::RequestLicenseResponse      RequestLicense(const v1::RequestLicenseRequest& req);
  v1::ApproveLicenseResponse      ApproveLicense(const v1::ApproveLicenseRequest& req);
  v1::UpdateLicenseStatusResponse UpdateLicenseStatus(const v1::UpdateLicenseStatusRequest& req);
  v1::GetLicenseResponse          GetLicense(const v1::GetLicenseRequest& req);
  v1::ListLicensesResponse        ListLicenses(const v1::ListLicensesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
