#pragma once

#include <cstdint>
#include <string_view>

namespace settlement::model {

enum class RequestStatus : std::uint8_t {
  kPending   = 1,
  kCompleted = 2,
  kFailed    = 3,
  kTimedOut  = 4,
};

constexpr bool IsTerminal(RequestStatus status) {
  return status != RequestStatus::kPending;
}

// A request leaves Pending exactly once and is never re-opened.
constexpr bool CanTransition(RequestStatus from, RequestStatus to) {
  return from == RequestStatus::kPending && IsTerminal(to);
}

constexpr std::string_view ToString(RequestStatus status) {
  switch (status) {
    case RequestStatus::kPending:
      return "pending";
    case RequestStatus::kCompleted:
      return "completed";
    case RequestStatus::kFailed:
      return "failed";
    case RequestStatus::kTimedOut:
      return "timed_out";
  }
  return "unknown";
}

enum class SessionPhase : std::uint8_t {
  kOpen           = 1,
  kAwaitingResult = 2,
  kResolved       = 3,
  kUnresolved     = 4,
};

constexpr bool IsClosed(SessionPhase phase) {
  return phase == SessionPhase::kResolved || phase == SessionPhase::kUnresolved;
}

// Escrows are live (held in custody on behalf of bidders) only while the
// session has not been closed.
constexpr bool HoldsEscrow(SessionPhase phase) {
  return !IsClosed(phase);
}

constexpr bool CanTransition(SessionPhase from, SessionPhase to) {
  switch (from) {
    case SessionPhase::kOpen:
      return to == SessionPhase::kAwaitingResult;
    case SessionPhase::kAwaitingResult:
      return IsClosed(to);
    case SessionPhase::kResolved:
    case SessionPhase::kUnresolved:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::kOpen:
      return "open";
    case SessionPhase::kAwaitingResult:
      return "awaiting_result";
    case SessionPhase::kResolved:
      return "resolved";
    case SessionPhase::kUnresolved:
      return "unresolved";
  }
  return "unknown";
}

} // namespace settlement::model
