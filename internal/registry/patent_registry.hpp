#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/cipher/ciphertext_vault.hpp"
#include "internal/core/sequence_generator.hpp"
#include "internal/events/event_log.hpp"
#include "internal/registry/agreement_registry.hpp"
#include "internal/util/time.hpp"

namespace settlement::registry {

inline constexpr std::uint32_t kMaxRoyaltyRate       = 10000; // basis points
inline constexpr std::uint32_t kMinValidityYears     = 1;
inline constexpr std::uint32_t kMaxValidityYears     = 20;
inline constexpr std::uint32_t kMinLicenseDuration   = 1;
inline constexpr std::uint32_t kMaxLicenseDuration   = 3650; // days

struct PatentTerms {
  std::uint32_t royalty_rate     = 0;
  model::Amount min_license_fee  = 0;
  std::uint32_t exclusivity_days = 0;
  std::uint32_t validity_years   = 0;
  std::string   patent_hash;
  std::uint32_t territory_code = 0;
  bool          confidential   = false;
};

struct LicenseTerms {
  model::AssetId patent_id     = 0;
  model::Amount  proposed_fee  = 0;
  std::uint32_t  proposed_rate = 0;
  model::Amount  revenue_cap   = 0;
  std::uint32_t  duration_days = 0;
  bool           exclusive     = false;
  bool           auto_renewal  = false;
  std::uint32_t  territory_mask = 0;
};

struct RegistryOptions {
  // only account allowed to use EmergencyPause / EmergencyResume
  model::Account operator_account;
};

/*
  Patents (the biddable assets) and licenses (the agreements whose
  royalties are verified).

  Royalty rates are confidential: they are sealed into ciphertext handles
  on the way in and never stored in the clear.
*/
class PatentRegistry final : public AgreementRegistry {
 public:
  PatentRegistry(std::shared_ptr<core::SequenceGenerator> sequences, std::shared_ptr<cipher::ValueSealer> sealer,
                 std::shared_ptr<events::EventLog> events, std::shared_ptr<util::TimeSource> clock, RegistryOptions options);

  model::AssetId RegisterPatent(core::UnitOfWork& uow, const model::Account& caller, const PatentTerms& terms);

  db::model::PatentRecord    GetPatent(core::UnitOfWork& uow, model::AssetId id);
  std::vector<model::AssetId> PatentsOf(core::UnitOfWork& uow, const model::Account& owner);

  void UpdatePatentStatus(core::UnitOfWork& uow, const model::Account& caller, model::AssetId id, model::PatentStatus status);

  model::PatentStatus EmergencyPause(core::UnitOfWork& uow, const model::Account& caller, model::AssetId id);
  model::PatentStatus EmergencyResume(core::UnitOfWork& uow, const model::Account& caller, model::AssetId id);

  model::LicenseId RequestLicense(core::UnitOfWork& uow, const model::Account& caller, const LicenseTerms& terms);

  void ApproveLicense(core::UnitOfWork& uow, const model::Account& caller, model::LicenseId id, std::uint32_t duration_days);

  void UpdateLicenseStatus(core::UnitOfWork& uow, const model::Account& caller, model::LicenseId id, model::LicenseStatus status);

  db::model::LicenseRecord      GetLicense(core::UnitOfWork& uow, model::LicenseId id);
  std::vector<model::LicenseId> LicensesOf(core::UnitOfWork& uow, const model::Account& licensee);

  std::uint64_t RoyaltyPaymentCount(core::UnitOfWork& uow, model::LicenseId id);

  // AgreementRegistry
  std::optional<AssetView>     FindAsset(core::UnitOfWork& uow, model::AssetId id) override;
  std::optional<AgreementView> FindAgreement(core::UnitOfWork& uow, model::LicenseId id) override;
  void AwardExclusive(core::UnitOfWork& uow, model::AssetId id, const model::Account& winner) override;

 private:
  void SetPatentStatus(core::UnitOfWork& uow, db::model::PatentRecord& patent, model::PatentStatus status);

  std::shared_ptr<core::SequenceGenerator> sequences_;
  std::shared_ptr<cipher::ValueSealer>     sealer_;
  std::shared_ptr<events::EventLog>        events_;
  std::shared_ptr<util::TimeSource>        clock_;
  RegistryOptions                          options_;
};

} // namespace settlement::registry
