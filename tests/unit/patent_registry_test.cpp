#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace settlement;
using settlement::testing::EngineFixture;
using settlement::testing::ExpectThrows;
using settlement::testing::kOperator;

registry::PatentTerms Terms() {
  registry::PatentTerms terms;
  terms.royalty_rate     = 250;
  terms.min_license_fee  = 40;
  terms.exclusivity_days = 90;
  terms.validity_years   = 20;
  terms.patent_hash      = "sha256:abc";
  terms.territory_code   = 840;
  terms.confidential     = true;
  return terms;
}

void TestRegisterValidatesTerms() {
  EngineFixture f;

  auto terms         = Terms();
  terms.royalty_rate = registry::kMaxRoyaltyRate + 1;
  ExpectThrows<util::InvalidInput>([&] { f.engine->RegisterPatent("owner", terms); }, "rate above 100%");

  terms                = Terms();
  terms.validity_years = 0;
  ExpectThrows<util::InvalidInput>([&] { f.engine->RegisterPatent("owner", terms); }, "zero validity");
  terms.validity_years = 21;
  ExpectThrows<util::InvalidInput>([&] { f.engine->RegisterPatent("owner", terms); }, "validity above 20 years");

  terms             = Terms();
  terms.patent_hash = "";
  ExpectThrows<util::InvalidInput>([&] { f.engine->RegisterPatent("owner", terms); }, "missing hash");
  ExpectThrows<util::InvalidInput>([&] { f.engine->RegisterPatent("", Terms()); }, "missing caller");
  ExpectThrows<util::NotFound>([&] { f.engine->GetPatent(1); }, "nothing registered");
}

void TestRegisterStoresSealedRate() {
  EngineFixture f;
  const auto    id = f.engine->RegisterPatent("owner", Terms());
  assert(id == 1);
  assert(f.engine->RegisterPatent("owner", Terms()) == 2);
  assert(f.engine->RegisterPatent("other", Terms()) == 3);

  const auto patent = f.engine->GetPatent(id);
  assert(patent.owner == "owner");
  assert(patent.status == model::PatentStatus::kActive);
  assert(patent.territory_code == 840);
  assert(patent.confidential);
  assert(patent.royalty_rate_handle.size() == 64);
  assert(f.vault->Reveal(patent.royalty_rate_handle).value() == 250);

  const auto twenty_years_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(24 * 365 * 20)).count();
  assert(patent.expires_at_ms - patent.registered_at_ms == static_cast<std::uint64_t>(twenty_years_ms));

  assert((f.engine->PatentsOf("owner") == std::vector<model::AssetId>{1, 2}));
  assert(f.engine->PatentsOf("nobody").empty());
}

void TestStatusUpdatesAndEmergencyControls() {
  EngineFixture f;
  const auto    id = f.engine->RegisterPatent("owner", Terms());

  ExpectThrows<util::Authorization>([&] { f.engine->UpdatePatentStatus("mallory", id, model::PatentStatus::kRevoked); }, "not owner");
  f.engine->UpdatePatentStatus("owner", id, model::PatentStatus::kExpired);
  assert(f.engine->GetPatent(id).status == model::PatentStatus::kExpired);

  ExpectThrows<util::Authorization>([&] { f.engine->EmergencyPause("owner", id); }, "only the operator pauses");
  assert(f.engine->EmergencyPause(kOperator, id) == model::PatentStatus::kSuspended);
  // pausing twice keeps the original status to restore
  assert(f.engine->EmergencyPause(kOperator, id) == model::PatentStatus::kSuspended);
  assert(f.engine->EmergencyResume(kOperator, id) == model::PatentStatus::kExpired);

  // resume without a recorded pause falls back to Active
  f.engine->UpdatePatentStatus("owner", id, model::PatentStatus::kSuspended);
  assert(f.engine->EmergencyResume(kOperator, id) == model::PatentStatus::kActive);
}

void TestEmergencyControlsNeedConfiguredOperator() {
  core::EngineOptions options;
  EngineFixture       f(options);
  const auto          id = f.engine->RegisterPatent("owner", Terms());
  ExpectThrows<util::Authorization>([&] { f.engine->EmergencyPause("", id); }, "no operator configured");
}

void TestLicenseLifecycle() {
  EngineFixture f;
  const auto    patent = f.engine->RegisterPatent("owner", Terms());

  registry::LicenseTerms terms;
  terms.patent_id     = patent;
  terms.proposed_fee  = 100;
  terms.proposed_rate = 300;
  terms.duration_days = 0;
  ExpectThrows<util::InvalidInput>([&] { f.engine->RequestLicense("licensee", terms); }, "zero days");
  terms.duration_days = registry::kMaxLicenseDuration + 1;
  ExpectThrows<util::InvalidInput>([&] { f.engine->RequestLicense("licensee", terms); }, "too long");
  terms.duration_days = 365;
  terms.proposed_rate = registry::kMaxRoyaltyRate + 1;
  ExpectThrows<util::InvalidInput>([&] { f.engine->RequestLicense("licensee", terms); }, "rate too high");
  terms.proposed_rate = 300;
  terms.patent_id     = 77;
  ExpectThrows<util::NotFound>([&] { f.engine->RequestLicense("licensee", terms); }, "unknown patent");
  terms.patent_id = patent;

  const auto id = f.engine->RequestLicense("licensee", terms);
  auto       license = f.engine->GetLicense(id);
  assert(license.status == model::LicenseStatus::kPending);
  assert(license.licensor == "owner");
  assert(f.vault->Reveal(license.royalty_rate_handle).value() == 300);
  assert(f.engine->LicensesOf("licensee") == std::vector<model::LicenseId>{id});

  ExpectThrows<util::Authorization>([&] { f.engine->ApproveLicense("licensee", id, 30); }, "licensee cannot approve");
  ExpectThrows<util::InvalidInput>([&] { f.engine->ApproveLicense("owner", id, 0); }, "zero duration");

  f.clock->Advance(std::chrono::hours(5));
  f.engine->ApproveLicense("owner", id, 30);
  license = f.engine->GetLicense(id);
  assert(license.status == model::LicenseStatus::kActive);
  assert(license.ends_at_ms - license.starts_at_ms == 30ull * 24 * 3600 * 1000);
  ExpectThrows<util::InvalidState>([&] { f.engine->ApproveLicense("owner", id, 30); }, "already approved");

  ExpectThrows<util::Authorization>([&] { f.engine->UpdateLicenseStatus("licensee", id, model::LicenseStatus::kRevoked); },
                                    "only the licensor");
  f.engine->UpdateLicenseStatus("owner", id, model::LicenseStatus::kSuspended);
  assert(f.engine->GetLicense(id).status == model::LicenseStatus::kSuspended);
  assert(f.engine->RoyaltyPaymentCount(id) == 0);
  ExpectThrows<util::NotFound>([&] { f.engine->GetLicense(id + 1); }, "unknown license");

  f.engine->UpdatePatentStatus("owner", patent, model::PatentStatus::kRevoked);
  ExpectThrows<util::InvalidState>([&] { f.engine->RequestLicense("licensee", terms); }, "patent not active");
}

void TestEventsRecordRegistryChanges() {
  EngineFixture f;
  const auto    patent = f.engine->RegisterPatent("owner", Terms());
  f.engine->EmergencyPause(kOperator, patent);

  const auto events = f.engine->ListEvents(0, 0);
  assert(events.size() == 2);
  assert(events[0].kind == model::EventKind::kPatentRegistered);
  assert(events[1].kind == model::EventKind::kPatentStatusChanged);
  assert(events[0].sequence < events[1].sequence);
  assert(f.engine->ListEvents(events[0].sequence, 10).size() == 1);
}

} // namespace

int main() {
  TestRegisterValidatesTerms();
  TestRegisterStoresSealedRate();
  TestStatusUpdatesAndEmergencyControls();
  TestEmergencyControlsNeedConfiguredOperator();
  TestLicenseLifecycle();
  TestEventsRecordRegistryChanges();

  std::cout << "settlement_unit_patent_registry: pass\n";
  return 0;
}
