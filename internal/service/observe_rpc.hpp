#pragma once

#include <chrono>
#include <initializer_list>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace flotilla::service {

// Span, request metrics and an error log around one RPC body.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::initializer_list<std::pair<std::string_view, std::string_view>> attributes, Fn&& fn) {
  observability::SpanScope span(route);
  for (const auto& [key, value] : attributes) {
    span.SetAttribute(key, value);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    auto& metrics = observability::Metrics::Instance();
    metrics.RecordRequest(route, success);
    metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
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
    FLOTILLA_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace flotilla::service
