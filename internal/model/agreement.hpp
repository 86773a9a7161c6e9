#pragma once

#include <cstdint>
#include <string_view>

namespace settlement::model {

// Numeric values are part of the public API (registry status updates).
enum class PatentStatus : std::uint8_t {
  kActive              = 0,
  kSuspended           = 1,
  kExpired             = 2,
  kRevoked             = 3,
  kExclusivelyLicensed = 4,
};

enum class LicenseStatus : std::uint8_t {
  kPending   = 0,
  kActive    = 1,
  kSuspended = 2,
  kExpired   = 3,
  kRevoked   = 4,
};

enum class VerificationOutcome : std::uint8_t {
  kUnverified = 0,
  kValid      = 1,
  kInvalid    = 2,
};

constexpr std::string_view ToString(PatentStatus status) {
  switch (status) {
    case PatentStatus::kActive:
      return "active";
    case PatentStatus::kSuspended:
      return "suspended";
    case PatentStatus::kExpired:
      return "expired";
    case PatentStatus::kRevoked:
      return "revoked";
    case PatentStatus::kExclusivelyLicensed:
      return "exclusively_licensed";
  }
  return "unknown";
}

constexpr std::string_view ToString(LicenseStatus status) {
  switch (status) {
    case LicenseStatus::kPending:
      return "pending";
    case LicenseStatus::kActive:
      return "active";
    case LicenseStatus::kSuspended:
      return "suspended";
    case LicenseStatus::kExpired:
      return "expired";
    case LicenseStatus::kRevoked:
      return "revoked";
  }
  return "unknown";
}

constexpr std::string_view ToString(VerificationOutcome outcome) {
  switch (outcome) {
    case VerificationOutcome::kUnverified:
      return "unverified";
    case VerificationOutcome::kValid:
      return "valid";
    case VerificationOutcome::kInvalid:
      return "invalid";
  }
  return "unknown";
}

} // namespace settlement::model
