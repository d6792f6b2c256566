#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace vesting::service {

/*
  Runs one RPC body inside a span and records request count and latency.
  Ledger rejections log at warn with their reason; anything else is an
  error. The exception is rethrown for the gRPC layer to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const vesting::observability::LedgerSpanTags& tags, Fn&& fn) {
  vesting::observability::SpanScope span(route);
  span.Tag(tags);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    vesting::observability::Metrics::Instance().RecordRequest(route, success);
    vesting::observability::Metrics::Instance().ObserveRequestLatencyMs(
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
  } catch (const vesting::util::LedgerError& ex) {
    span.RecordException(ex.what());
    VESTING_LOG_WARN("RPC rejected", {vesting::observability::StringField("route", route),
                                      vesting::observability::StringField("reason", vesting::util::ReasonName(ex.reason())),
                                      vesting::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    VESTING_LOG_ERROR("RPC failed", {vesting::observability::StringField("route", route), vesting::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  return ObserveRpc(route, vesting::observability::LedgerSpanTags{}, std::forward<Fn>(fn));
}

} // namespace vesting::service
