#pragma once

#include <cstdint>
#include <string_view>

namespace settlement::model {

enum class EventKind : std::uint8_t {
  kRequestIssued = 1,
  kRequestCompleted,
  kRequestFailed,
  kRequestTimedOut,
  kRefundCredited,
  kRefundWithdrawn,
  kBiddingStarted,
  kBidSubmitted,
  kBiddingFinalized,
  kWinnerAwarded,
  kBiddingUnresolved,
  kRoyaltyPaid,
  kVerificationRequested,
  kVerificationOutcome,
  kPatentRegistered,
  kPatentStatusChanged,
  kLicenseRequested,
  kLicenseApproved,
  kLicenseStatusChanged,
  kDeposited,
};

constexpr std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kRequestIssued:
      return "RequestIssued";
    case EventKind::kRequestCompleted:
      return "RequestCompleted";
    case EventKind::kRequestFailed:
      return "RequestFailed";
    case EventKind::kRequestTimedOut:
      return "RequestTimedOut";
    case EventKind::kRefundCredited:
      return "RefundCredited";
    case EventKind::kRefundWithdrawn:
      return "RefundWithdrawn";
    case EventKind::kBiddingStarted:
      return "BiddingStarted";
    case EventKind::kBidSubmitted:
      return "BidSubmitted";
    case EventKind::kBiddingFinalized:
      return "BiddingFinalized";
    case EventKind::kWinnerAwarded:
      return "WinnerAwarded";
    case EventKind::kBiddingUnresolved:
      return "BiddingUnresolved";
    case EventKind::kRoyaltyPaid:
      return "RoyaltyPaid";
    case EventKind::kVerificationRequested:
      return "VerificationRequested";
    case EventKind::kVerificationOutcome:
      return "VerificationOutcome";
    case EventKind::kPatentRegistered:
      return "PatentRegistered";
    case EventKind::kPatentStatusChanged:
      return "PatentStatusChanged";
    case EventKind::kLicenseRequested:
      return "LicenseRequested";
    case EventKind::kLicenseApproved:
      return "LicenseApproved";
    case EventKind::kLicenseStatusChanged:
      return "LicenseStatusChanged";
    case EventKind::kDeposited:
      return "Deposited";
  }
  return "Unknown";
}

} // namespace settlement::model
