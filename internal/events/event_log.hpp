#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/unit_of_work.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/util/time.hpp"

namespace settlement::events {

struct Attr {
  std::string key;
  std::string value;

  Attr(std::string_view k, std::string_view v) : key(k), value(v) {
  }
  Attr(std::string_view k, std::uint64_t v) : key(k), value(std::to_string(v)) {
  }
};

/*
  Append-only event stream.

  Events are written in the caller's transaction and logged once it
  commits, so a rolled back operation leaves neither a row nor a log line.
*/
class EventLog {
 public:
  explicit EventLog(std::shared_ptr<util::TimeSource> clock);

  void Append(core::UnitOfWork& uow, model::EventKind kind, std::initializer_list<Attr> attributes);

  std::vector<db::model::EventRecord> List(core::UnitOfWork& uow, std::uint64_t after_sequence, std::uint64_t limit) const;

 private:
  std::shared_ptr<util::TimeSource> clock_;
};

std::string Describe(const db::model::EventRecord& record);

} // namespace settlement::events
