#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace workledger::service {

// Span + request metrics around one RPC body; failures are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  workledger::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       observe    = [&](bool success) {
    workledger::observability::Metrics::Instance().RecordRequest(route, success);
    workledger::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      observe(true);
      return;
    } else {
      auto result = fn();
      observe(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    WORKLEDGER_LOG_ERROR("RPC failed", {workledger::observability::StringField("route", route), workledger::observability::StringField("error", ex.what()),
                                        workledger::observability::StringField(subject_key, subject)});
    observe(false);
    throw;
  }
}

} // namespace workledger::service
