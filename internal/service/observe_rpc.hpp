#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace settlement::service {

/*
  Wraps one RPC: span, request count, latency, and an error log line on
  failure. Exceptions are rethrown for the gRPC adapter to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  settlement::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    settlement::observability::Metrics::Instance().RecordRequest(route, success);
    settlement::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SETTLEMENT_LOG_WARN("RPC failed", {settlement::observability::StringField("route", route),
                                       settlement::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace settlement::service
