#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace fieldwake::service {

/*
  Span + request metrics around one RPC body. Failures are logged with the
  route and rethrown for the gRPC adapter to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view device_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!device_id.empty()) {
    span.SetAttribute("device.id", device_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(route, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    FIELDWAKE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                       observability::StringField("device_id", device_id)});
    finish(false);
    throw;
  }
}

} // namespace fieldwake::service
