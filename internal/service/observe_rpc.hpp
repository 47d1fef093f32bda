#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace lieko::service {

namespace detail {

inline void RecordOutcome(std::string_view route, bool success, std::chrono::steady_clock::time_point started_at) {
  observability::Metrics::Instance().RecordRequest(route, success);
  observability::Metrics::Instance().ObserveRequestLatencyMs(
      route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
}

} // namespace detail

/*
  Wraps one service call in a span, request metrics and failure logging.
  Exceptions are rethrown unchanged for the transport to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view resource, Fn&& fn) {
  observability::SpanScope span(route);
  if (!resource.empty()) {
    span.SetAttribute("lieko.resource", resource);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      detail::RecordOutcome(route, true, started_at);
      return;
    } else {
      auto result = fn();
      detail::RecordOutcome(route, true, started_at);
      return result;
    }
  } catch (const util::Error& ex) {
    span.RecordException(ex.what());
    LIEKO_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("resource", resource),
                                   observability::StringField("code", util::ErrorCodeName(ex.Code())),
                                   observability::StringField("error", ex.what())});
    detail::RecordOutcome(route, false, started_at);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    LIEKO_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("resource", resource),
                                   observability::StringField("error", ex.what())});
    detail::RecordOutcome(route, false, started_at);
    throw;
  }
}

} // namespace lieko::service
