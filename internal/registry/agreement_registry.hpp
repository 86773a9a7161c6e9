#pragma once

#include <optional>

#include "internal/core/unit_of_work.hpp"
#include "internal/model/agreement.hpp"
#include "internal/model/types.hpp"

namespace settlement::registry {

// What the bidding engine needs to know about a biddable asset.
struct AssetView {
  model::AssetId      id = 0;
  model::Account      controller;
  model::PatentStatus status = model::PatentStatus::kActive;
  model::Amount       min_escrow = 0;
};

// What the verification engine needs to know about an agreement.
struct AgreementView {
  model::LicenseId        id       = 0;
  model::AssetId          asset_id = 0;
  model::Account          licensee;
  model::Account          licensor;
  model::LicenseStatus    status = model::LicenseStatus::kPending;
  model::CiphertextHandle rate_handle;
};

/*
  Registry collaborator as seen by the coordination layer.
*/
class AgreementRegistry {
 public:
  virtual ~AgreementRegistry() = default;

  virtual std::optional<AssetView>     FindAsset(core::UnitOfWork& uow, model::AssetId id)         = 0;
  virtual std::optional<AgreementView> FindAgreement(core::UnitOfWork& uow, model::LicenseId id) = 0;

  // Records the exclusive grant won in a bidding session.
  virtual void AwardExclusive(core::UnitOfWork& uow, model::AssetId id, const model::Account& winner) = 0;
};

} // namespace settlement::registry
