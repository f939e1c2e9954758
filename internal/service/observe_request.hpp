#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::service {

/*
  Wraps one request in a span, request metrics and an error log.
  Exceptions are rethrown unchanged for the transport to map.
*/
template <typename Fn>
auto ObserveRequest(std::string_view route, const resource::pipeline::v1::ResourceID* id, Fn&& fn) {
  resource::observability::SpanScope span(route);
  const std::string                  resource_id = id ? resource::util::Describe(*id) : std::string();
  if (id) {
    span.SetAttribute("resource.id", resource_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      resource::observability::Metrics::Instance().RecordRequest(route, true);
      resource::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      resource::observability::Metrics::Instance().RecordRequest(route, true);
      resource::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    // misses and stale lookups are answers, not failures of the daemon
    const bool miss = dynamic_cast<const resource::util::NotFound*>(&ex) || dynamic_cast<const resource::util::Stale*>(&ex);
    resource::observability::Log(miss ? spdlog::level::debug : spdlog::level::warn, "request failed",
                                 {resource::observability::StringField("route", route), resource::observability::StringField("error", ex.what()),
                                  resource::observability::StringField("resource_id", resource_id)});
    resource::observability::Metrics::Instance().RecordRequest(route, false);
    resource::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace resource::service
