#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace hosting::service {

/*
  Runs one RPC body inside a span, recording request count and latency per
  route. Failures are logged before the exception travels on to the
  transport adapter.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  using hosting::observability::IntField;
  using hosting::observability::Metrics;
  using hosting::observability::StringField;

  hosting::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("hosting.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    const auto elapsed = std::chrono::steady_clock::now() - started_at;
    Metrics::Instance().RecordRequest(route, success);
    Metrics::Instance().ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(elapsed).count());
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      HOSTING_LOG_DEBUG("RPC done", {StringField("route", route), StringField("subject", subject), IntField("latency_us", finish(true))});
      return;
    } else {
      auto result = fn();
      HOSTING_LOG_DEBUG("RPC done", {StringField("route", route), StringField("subject", subject), IntField("latency_us", finish(true))});
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    HOSTING_LOG_ERROR("RPC failed", {StringField("route", route), StringField("subject", subject), StringField("error", ex.what()),
                                     IntField("latency_us", finish(false))});
    throw;
  }
}

} // namespace hosting::service
