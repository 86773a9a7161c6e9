#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/correlation.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/types.hpp"

namespace settlement::db::model {

/*
  Persistent decryption request.

  IMPORTANT:
  - status only ever moves Pending -> terminal, exactly once.
  - resolved_at_ms is 0 while the request is pending.
  - handles keep the order the issuer supplied; cleartext words come back
    in the same order.
*/

struct RequestRecord {
  std::uint64_t id = 0;
  std::string   issuer;

  std::uint64_t created_at_ms  = 0;
  std::uint64_t resolved_at_ms = 0;

  settlement::model::RequestStatus    status   = settlement::model::RequestStatus::kPending;
  settlement::model::CorrelationTag   correlation{};
  settlement::model::CallbackSelector selector = settlement::model::CallbackSelector::kCompleteBidding;

  std::vector<std::string> handles;
  std::string              failure_reason;
};

} // namespace settlement::db::model
