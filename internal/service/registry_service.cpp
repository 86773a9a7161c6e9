#include "registry_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"

namespace settlement::service {

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::RegisterPatentResponse RegistryService::RegisterPatent(const v1::RegisterPatentRequest& req) {
  return ObserveRpc("RegistryService.RegisterPatent", [&] {
    registry::PatentTerms terms;
    terms.royalty_rate     = req.royalty_rate();
    terms.min_license_fee  = req.min_license_fee();
    terms.exclusivity_days = req.exclusivity_days();
    terms.validity_years   = req.validity_years();
    terms.patent_hash      = req.patent_hash();
    terms.territory_code   = req.territory_code();
    terms.confidential     = req.confidential();

    v1::RegisterPatentResponse resp;
    resp.set_patent_id(ctx_.engine->RegisterPatent(req.caller(), terms));
    return resp;
  });
}

v1::GetPatentResponse RegistryService::GetPatent(const v1::GetPatentRequest& req) {
  return ObserveRpc("RegistryService.GetPatent", [&] {
    v1::GetPatentResponse resp;
    *resp.mutable_patent() = ToProto(ctx_.engine->GetPatent(req.patent_id()));
    return resp;
  });
}

v1::ListPatentsResponse RegistryService::ListPatents(const v1::ListPatentsRequest& req) {
  return ObserveRpc("RegistryService.ListPatents", [&] {
    v1::ListPatentsResponse resp;
    for (auto id : ctx_.engine->PatentsOf(req.owner())) {
      resp.add_patent_ids(id);
    }
    return resp;
  });
}

v1::UpdatePatentStatusResponse RegistryService::UpdatePatentStatus(const v1::UpdatePatentStatusRequest& req) {
  return ObserveRpc("RegistryService.UpdatePatentStatus", [&] {
    ctx_.engine->UpdatePatentStatus(req.caller(), req.patent_id(), PatentStatusFromProto(req.status()));
    return v1::UpdatePatentStatusResponse{};
  });
}

v1::EmergencyResponse RegistryService::EmergencyPause(const v1::EmergencyRequest& req) {
  return ObserveRpc("RegistryService.EmergencyPause", [&] {
    v1::EmergencyResponse resp;
    resp.set_status(ToProto(ctx_.engine->EmergencyPause(req.caller(), req.patent_id())));
    return resp;
  });
}

v1::EmergencyResponse RegistryService::EmergencyResume(const v1::EmergencyRequest& req) {
  return ObserveRpc("RegistryService.EmergencyResume", [&] {
    v1::EmergencyResponse resp;
    resp.set_status(ToProto(ctx_.engine->EmergencyResume(req.caller(), req.patent_id())));
    return resp;
  });
}

v1::RequestLicenseResponse RegistryService::RequestLicense(const v1::RequestLicenseRequest& req) {
  return ObserveRpc("RegistryService.RequestLicense", [&] {
    registry::LicenseTerms terms;
    terms.patent_id      = req.patent_id();
    terms.proposed_fee   = req.proposed_fee();
    terms.proposed_rate  = req.proposed_royalty_rate();
    terms.revenue_cap    = req.revenue_cap();
    terms.duration_days  = req.duration_days();
    terms.exclusive      = req.request_exclusive();
    terms.auto_renewal   = req.auto_renewal();
    terms.territory_mask = req.territory_mask();

    v1::RequestLicenseResponse resp;
    resp.set_license_id(ctx_.engine->RequestLicense(req.caller(), terms));
    return resp;
  });
}

v1::ApproveLicenseResponse RegistryService::ApproveLicense(const v1::ApproveLicenseRequest& req) {
  return ObserveRpc("RegistryService.ApproveLicense", [&] {
    ctx_.engine->ApproveLicense(req.caller(), req.license_id(), req.duration_days());
    return v1::ApproveLicenseResponse{};
  });
}

v1::UpdateLicenseStatusResponse RegistryService::UpdateLicenseStatus(const v1::UpdateLicenseStatusRequest& req) {
  return ObserveRpc("RegistryService.UpdateLicenseStatus", [&] {
    ctx_.engine->UpdateLicenseStatus(req.caller(), req.license_id(), LicenseStatusFromProto(req.status()));
    return v1::UpdateLicenseStatusResponse{};
  });
}

v1::GetLicenseResponse RegistryService::GetLicense(const v1::GetLicenseRequest& req) {
  return ObserveRpc("RegistryService.GetLicense", [&] {
    v1::GetLicenseResponse resp;
    *resp.mutable_license() = ToProto(ctx_.engine->GetLicense(req.license_id()));
    return resp;
  });
}

v1::ListLicensesResponse RegistryService::ListLicenses(const v1::ListLicensesRequest& req) {
  return ObserveRpc("RegistryService.ListLicenses", [&] {
    v1::ListLicensesResponse resp;
    for (auto id : ctx_.engine->LicensesOf(req.licensee())) {
      resp.add_license_ids(id);
    }
    return resp;
  });
}

} // namespace settlement::service
