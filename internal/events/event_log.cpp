#include "internal/events/event_log.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"

namespace settlement::events {

EventLog::EventLog(std::shared_ptr<util::TimeSource> clock) : clock_(std::move(clock)) {
}

void EventLog::Append(core::UnitOfWork& uow, model::EventKind kind, std::initializer_list<Attr> attributes) {
  db::model::EventRecord record;
  record.kind           = kind;
  record.occurred_at_ms = util::ToUnixMillis(clock_->Now());
  record.attributes.reserve(attributes.size());
  for (const auto& attr : attributes) {
    record.attributes.push_back({attr.key, attr.value});
  }

  core::Check(uow.Repo().AppendEvent(uow.Tx(), record), "append event");

  uow.AfterCommit([record = std::move(record)] {
    SETTLEMENT_LOG_INFO("event", {observability::IntField("seq", static_cast<std::int64_t>(record.sequence)),
                                  observability::StringField("detail", Describe(record))});
  });
}

std::vector<db::model::EventRecord> EventLog::List(core::UnitOfWork& uow, std::uint64_t after_sequence, std::uint64_t limit) const {
  return uow.Repo().ListEvents(uow.Tx(), after_sequence, limit);
}

std::string Describe(const db::model::EventRecord& record) {
  std::ostringstream out;
  out << model::ToString(record.kind);
  for (const auto& attr : record.attributes) {
    out << ' ' << attr.key << '=' << attr.value;
  }
  return out.str();
}

} // namespace settlement::events
