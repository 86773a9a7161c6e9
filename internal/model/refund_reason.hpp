#pragma once

#include <cstdint>
#include <string_view>

namespace settlement::model {

enum class RefundReason : std::uint8_t {
  kTimeout                  = 1,
  kOracleFailure            = 2,
  kLostBid                  = 3,
  kFailedVerificationEscrow = 4,
  kSupersededBid            = 5,
};

constexpr std::string_view ToString(RefundReason reason) {
  switch (reason) {
    case RefundReason::kTimeout:
      return "timeout";
    case RefundReason::kOracleFailure:
      return "oracle_failure";
    case RefundReason::kLostBid:
      return "lost_bid";
    case RefundReason::kFailedVerificationEscrow:
      return "failed_verification_escrow";
    case RefundReason::kSupersededBid:
      return "superseded_bid";
  }
  return "unknown";
}

} // namespace settlement::model
