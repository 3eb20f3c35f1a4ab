#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace tender::service {

/*
  Runs one RPC body inside a span and records request count and latency.
  Completion is logged at debug. A failure is logged at error with its
  reason and rethrown to the gRPC adapter.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& caller, std::uint64_t tender_id, Fn&& fn) {
  namespace obs = tender::observability;

  obs::SpanScope span(route);
  span.SetCaller(caller);
  span.SetTender(tender_id);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](std::string_view outcome) {
    const auto latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
    obs::Metrics::Instance().RecordRequest(route, outcome);
    obs::Metrics::Instance().ObserveRequestLatencyMs(route, latency_ms);
    return latency_ms;
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      const auto latency_ms = finish("ok");
      TENDER_LOG_DEBUG("RPC ok", {obs::StringField("route", route), obs::CallerField(caller), obs::TenderField(tender_id),
                                  obs::IntField("latency_us", static_cast<std::int64_t>(latency_ms * 1000))});
      return;
    } else {
      auto       result     = fn();
      const auto latency_ms = finish("ok");
      TENDER_LOG_DEBUG("RPC ok", {obs::StringField("route", route), obs::CallerField(caller), obs::TenderField(tender_id),
                                  obs::IntField("latency_us", static_cast<std::int64_t>(latency_ms * 1000))});
      return result;
    }
  } catch (const std::exception& ex) {
    const auto* kind = tender::util::ErrorKind(ex);
    span.RecordError(kind, ex.what());
    finish(kind);
    TENDER_LOG_ERROR("RPC failed", {obs::StringField("route", route), obs::StringField("kind", kind), obs::StringField("error", ex.what()),
                                    obs::CallerField(caller), obs::TenderField(tender_id)});
    throw;
  }
}

} // namespace tender::service
