#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/event_kind.hpp"

namespace settlement::db::model {

struct EventAttribute {
  std::string key;
  std::string value;
};

struct EventRecord {
  std::uint64_t sequence = 0;

  settlement::model::EventKind kind = settlement::model::EventKind::kRequestIssued;

  std::uint64_t               occurred_at_ms = 0;
  std::vector<EventAttribute> attributes;
};

} // namespace settlement::db::model
