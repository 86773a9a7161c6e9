#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/agreement.hpp"

namespace settlement::db::model {

struct PaymentRecord {
  std::uint64_t license_id = 0;
  std::uint64_t index      = 0;

  std::string   payer;
  std::string   revenue_handle;
  std::uint64_t paid_amount = 0;
  std::string   paid_handle;
  std::uint64_t reporting_period = 0;
  std::uint64_t paid_at_ms       = 0;

  settlement::model::VerificationOutcome outcome = settlement::model::VerificationOutcome::kUnverified;

  // Verification in flight (0 = none).
  std::uint64_t                request_id = 0;
  std::optional<std::uint64_t> expected_amount;
};

} // namespace settlement::db::model
