#pragma once

#include <cstdint>
#include <string>

namespace settlement::db::model {

struct AccountRecord {
  std::string   account;
  std::uint64_t balance = 0;

  // false models a recipient that rejects native transfers
  bool accepts_payouts = true;
};

struct RefundRecord {
  std::string   account;
  std::uint64_t balance = 0;
};

} // namespace settlement::db::model
