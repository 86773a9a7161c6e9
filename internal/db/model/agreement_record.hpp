#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/agreement.hpp"

namespace settlement::db::model {

struct PatentRecord {
  std::uint64_t id = 0;
  std::string   owner;

  std::string   royalty_rate_handle;
  std::uint64_t min_license_fee  = 0;
  std::uint32_t exclusivity_days = 0;
  std::uint32_t validity_years   = 0;
  std::string   patent_hash;
  std::uint32_t territory_code = 0;
  bool          confidential = false;

  settlement::model::PatentStatus                status = settlement::model::PatentStatus::kActive;
  std::optional<settlement::model::PatentStatus> status_before_pause;

  std::uint64_t registered_at_ms = 0;
  std::uint64_t expires_at_ms    = 0;
  std::string   exclusive_licensee;
};

struct LicenseRecord {
  std::uint64_t id        = 0;
  std::uint64_t patent_id = 0;
  std::string   licensee;
  std::string   licensor;

  std::uint64_t proposed_fee = 0;
  std::string   royalty_rate_handle;
  std::uint64_t revenue_cap    = 0;
  std::uint32_t duration_days  = 0;
  bool          exclusive      = false;
  bool          auto_renewal   = false;
  std::uint32_t territory_mask = 0;

  settlement::model::LicenseStatus status = settlement::model::LicenseStatus::kPending;

  std::uint64_t requested_at_ms = 0;
  std::uint64_t starts_at_ms    = 0;
  std::uint64_t ends_at_ms      = 0;
};

} // namespace settlement::db::model
