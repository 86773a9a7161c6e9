#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"

namespace settlement::db::model {

struct BidRecord {
  std::string   bidder;
  std::uint64_t escrow = 0;
  std::string   handle;
  std::uint64_t submitted_at_ms = 0;
};

/*
  One bidding session per asset. A replaced session overwrites the row.

  request_id is 0 until the session is finalized; winner is empty until
  the session resolves.
*/
struct SessionRecord {
  std::uint64_t asset_id = 0;
  std::string   controller;

  settlement::model::SessionPhase phase = settlement::model::SessionPhase::kOpen;

  std::uint64_t started_at_ms = 0;
  std::uint64_t end_time_ms   = 0;

  std::vector<BidRecord> bids;

  std::uint64_t request_id = 0;
  std::string   winner;
};

} // namespace settlement::db::model
