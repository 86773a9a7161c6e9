#include "internal/registry/patent_registry.hpp"

#include <chrono>

#include "internal/util/errors.hpp"

namespace settlement::registry {

namespace {

constexpr std::uint64_t kMillisPerDay = 24ULL * 60 * 60 * 1000;

void RequireCaller(const model::Account& caller) {
  if (caller.empty()) throw util::InvalidInput("caller required");
}

} // namespace

PatentRegistry::PatentRegistry(std::shared_ptr<core::SequenceGenerator> sequences, std::shared_ptr<cipher::ValueSealer> sealer,
                               std::shared_ptr<events::EventLog> events, std::shared_ptr<util::TimeSource> clock, RegistryOptions options)
    : sequences_(std::move(sequences)),
      sealer_(std::move(sealer)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      options_(std::move(options)) {
}

// ---------------------------------------------------------------------
// Patents
// ---------------------------------------------------------------------

model::AssetId PatentRegistry::RegisterPatent(core::UnitOfWork& uow, const model::Account& caller, const PatentTerms& terms) {
  RequireCaller(caller);
  if (terms.royalty_rate > kMaxRoyaltyRate) throw util::InvalidInput("royalty rate too high");
  if (terms.validity_years < kMinValidityYears || terms.validity_years > kMaxValidityYears) {
    throw util::InvalidInput("invalid validity period");
  }
  if (terms.patent_hash.empty()) throw util::InvalidInput("patent hash required");

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  db::model::PatentRecord patent;
  patent.id                  = sequences_->Next(uow, core::kPatentSequence);
  patent.owner               = caller;
  patent.royalty_rate_handle = sealer_->Seal(terms.royalty_rate);
  patent.min_license_fee     = terms.min_license_fee;
  patent.exclusivity_days    = terms.exclusivity_days;
  patent.validity_years      = terms.validity_years;
  patent.patent_hash         = terms.patent_hash;
  patent.territory_code      = terms.territory_code;
  patent.confidential        = terms.confidential;
  patent.status              = model::PatentStatus::kActive;
  patent.registered_at_ms    = now_ms;
  patent.expires_at_ms       = now_ms + static_cast<std::uint64_t>(terms.validity_years) * 365 * kMillisPerDay;

  core::Check(uow.Repo().InsertPatent(uow.Tx(), patent), "insert patent");
  events_->Append(uow, model::EventKind::kPatentRegistered, {{"patent_id", patent.id}, {"owner", caller}});
  return patent.id;
}

db::model::PatentRecord PatentRegistry::GetPatent(core::UnitOfWork& uow, model::AssetId id) {
  auto patent = uow.Repo().GetPatent(uow.Tx(), id);
  if (!patent) throw util::NotFound("invalid patent id " + std::to_string(id));
  return *patent;
}

std::vector<model::AssetId> PatentRegistry::PatentsOf(core::UnitOfWork& uow, const model::Account& owner) {
  return uow.Repo().ListPatentsByOwner(uow.Tx(), owner);
}

void PatentRegistry::SetPatentStatus(core::UnitOfWork& uow, db::model::PatentRecord& patent, model::PatentStatus status) {
  patent.status = status;
  core::Check(uow.Repo().UpdatePatent(uow.Tx(), patent), "update patent");
  events_->Append(uow, model::EventKind::kPatentStatusChanged, {{"patent_id", patent.id}, {"status", model::ToString(status)}});
}

void PatentRegistry::UpdatePatentStatus(core::UnitOfWork& uow, const model::Account& caller, model::AssetId id, model::PatentStatus status) {
  auto patent = GetPatent(uow, id);
  if (caller != patent.owner) throw util::Authorization("not patent owner");
  patent.status_before_pause.reset();
  SetPatentStatus(uow, patent, status);
}

model::PatentStatus PatentRegistry::EmergencyPause(core::UnitOfWork& uow, const model::Account& caller, model::AssetId id) {
  if (options_.operator_account.empty() || caller != options_.operator_account) throw util::Authorization("not authorized");

  auto patent = GetPatent(uow, id);
  if (patent.status != model::PatentStatus::kSuspended || !patent.status_before_pause) {
    patent.status_before_pause = patent.status;
  }
  SetPatentStatus(uow, patent, model::PatentStatus::kSuspended);
  return patent.status;
}

model::PatentStatus PatentRegistry::EmergencyResume(core::UnitOfWork& uow, const model::Account& caller, model::AssetId id) {
  if (options_.operator_account.empty() || caller != options_.operator_account) throw util::Authorization("not authorized");

  auto patent   = GetPatent(uow, id);
  auto restored = patent.status_before_pause.value_or(model::PatentStatus::kActive);
  patent.status_before_pause.reset();
  SetPatentStatus(uow, patent, restored);
  return patent.status;
}

// ---------------------------------------------------------------------
// Licenses
// ---------------------------------------------------------------------

model::LicenseId PatentRegistry::RequestLicense(core::UnitOfWork& uow, const model::Account& caller, const LicenseTerms& terms) {
  RequireCaller(caller);
  auto patent = GetPatent(uow, terms.patent_id);
  if (patent.status != model::PatentStatus::kActive) throw util::InvalidState("patent not active");
  if (terms.duration_days < kMinLicenseDuration || terms.duration_days > kMaxLicenseDuration) {
    throw util::InvalidInput("invalid duration");
  }
  if (terms.proposed_rate > kMaxRoyaltyRate) throw util::InvalidInput("royalty rate too high");

  db::model::LicenseRecord license;
  license.id                  = sequences_->Next(uow, core::kLicenseSequence);
  license.patent_id           = patent.id;
  license.licensee            = caller;
  license.licensor            = patent.owner;
  license.proposed_fee        = terms.proposed_fee;
  license.royalty_rate_handle = sealer_->Seal(terms.proposed_rate);
  license.revenue_cap         = terms.revenue_cap;
  license.duration_days       = terms.duration_days;
  license.exclusive           = terms.exclusive;
  license.auto_renewal        = terms.auto_renewal;
  license.territory_mask      = terms.territory_mask;
  license.status              = model::LicenseStatus::kPending;
  license.requested_at_ms     = util::ToUnixMillis(clock_->Now());

  core::Check(uow.Repo().InsertLicense(uow.Tx(), license), "insert license");
  events_->Append(uow, model::EventKind::kLicenseRequested,
                  {{"license_id", license.id}, {"patent_id", patent.id}, {"licensee", caller}});
  return license.id;
}

void PatentRegistry::ApproveLicense(core::UnitOfWork& uow, const model::Account& caller, model::LicenseId id, std::uint32_t duration_days) {
  auto license = GetLicense(uow, id);
  if (caller != license.licensor) throw util::Authorization("not the licensor");
  if (license.status != model::LicenseStatus::kPending) throw util::InvalidState("license not pending");
  if (duration_days < kMinLicenseDuration || duration_days > kMaxLicenseDuration) throw util::InvalidInput("invalid duration");

  const auto now_ms     = util::ToUnixMillis(clock_->Now());
  license.status        = model::LicenseStatus::kActive;
  license.duration_days = duration_days;
  license.starts_at_ms  = now_ms;
  license.ends_at_ms    = now_ms + static_cast<std::uint64_t>(duration_days) * kMillisPerDay;

  core::Check(uow.Repo().UpdateLicense(uow.Tx(), license), "approve license");
  events_->Append(uow, model::EventKind::kLicenseApproved, {{"license_id", id}, {"licensee", license.licensee}});
}

void PatentRegistry::UpdateLicenseStatus(core::UnitOfWork& uow, const model::Account& caller, model::LicenseId id,
                                         model::LicenseStatus status) {
  auto license = GetLicense(uow, id);
  if (caller != license.licensor) throw util::Authorization("not the licensor");

  license.status = status;
  core::Check(uow.Repo().UpdateLicense(uow.Tx(), license), "update license");
  events_->Append(uow, model::EventKind::kLicenseStatusChanged, {{"license_id", id}, {"status", model::ToString(status)}});
}

db::model::LicenseRecord PatentRegistry::GetLicense(core::UnitOfWork& uow, model::LicenseId id) {
  auto license = uow.Repo().GetLicense(uow.Tx(), id);
  if (!license) throw util::NotFound("invalid license id " + std::to_string(id));
  return *license;
}

std::vector<model::LicenseId> PatentRegistry::LicensesOf(core::UnitOfWork& uow, const model::Account& licensee) {
  return uow.Repo().ListLicensesByLicensee(uow.Tx(), licensee);
}

std::uint64_t PatentRegistry::RoyaltyPaymentCount(core::UnitOfWork& uow, model::LicenseId id) {
  GetLicense(uow, id);
  return uow.Repo().ListPayments(uow.Tx(), id).size();
}

// ---------------------------------------------------------------------
// AgreementRegistry
// ---------------------------------------------------------------------

std::optional<AssetView> PatentRegistry::FindAsset(core::UnitOfWork& uow, model::AssetId id) {
  auto patent = uow.Repo().GetPatent(uow.Tx(), id);
  if (!patent) return std::nullopt;
  return AssetView{patent->id, patent->owner, patent->status, patent->min_license_fee};
}

std::optional<AgreementView> PatentRegistry::FindAgreement(core::UnitOfWork& uow, model::LicenseId id) {
  auto license = uow.Repo().GetLicense(uow.Tx(), id);
  if (!license) return std::nullopt;
  return AgreementView{license->id, license->patent_id, license->licensee, license->licensor, license->status, license->royalty_rate_handle};
}

void PatentRegistry::AwardExclusive(core::UnitOfWork& uow, model::AssetId id, const model::Account& winner) {
  auto patent               = GetPatent(uow, id);
  patent.exclusive_licensee = winner;
  patent.status_before_pause.reset();
  SetPatentStatus(uow, patent, model::PatentStatus::kExclusivelyLicensed);
}

} // namespace settlement::registry
