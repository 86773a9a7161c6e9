#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/types.hpp"

namespace settlement::model {

/*
  Correlation tag: the business case a decryption request resolves.

  Stored alongside each request so that dispatch on callback is a single
  exhaustive visit rather than a lookup across parallel maps.
*/

struct BiddingCorrelation {
  AssetId asset_id = 0;

  bool operator==(const BiddingCorrelation&) const = default;
};

struct VerificationCorrelation {
  LicenseId     license_id    = 0;
  std::uint64_t payment_index = 0;

  bool operator==(const VerificationCorrelation&) const = default;
};

using CorrelationTag = std::variant<BiddingCorrelation, VerificationCorrelation>;

// Oracle callback entry point that must answer a request.
enum class CallbackSelector : std::uint8_t {
  kCompleteBidding      = 1,
  kCompleteVerification = 2,
};

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

inline CallbackSelector SelectorFor(const CorrelationTag& tag) {
  return std::visit(Overloaded{[](const BiddingCorrelation&) { return CallbackSelector::kCompleteBidding; },
                               [](const VerificationCorrelation&) { return CallbackSelector::kCompleteVerification; }},
                    tag);
}

inline std::string Describe(const CorrelationTag& tag) {
  return std::visit(Overloaded{[](const BiddingCorrelation& b) { return "bidding:" + std::to_string(b.asset_id); },
                               [](const VerificationCorrelation& v) {
                                 return "verification:" + std::to_string(v.license_id) + "/" + std::to_string(v.payment_index);
                               }},
                    tag);
}

constexpr std::string_view ToString(CallbackSelector selector) {
  switch (selector) {
    case CallbackSelector::kCompleteBidding:
      return "complete_bidding";
    case CallbackSelector::kCompleteVerification:
      return "complete_verification";
  }
  return "unknown";
}

} // namespace settlement::model
