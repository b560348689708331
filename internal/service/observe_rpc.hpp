#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace outflow::service {

/*
  Logs one service call: route and duration on success, route, duration and
  error on failure. Errors are always rethrown.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      observability::Log(spdlog::level::debug, "RPC completed",
                         {observability::StringField("route", route), observability::IntField("duration_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      observability::Log(spdlog::level::debug, "RPC completed",
                         {observability::StringField("route", route), observability::IntField("duration_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    OUTFLOW_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::IntField("duration_ms", elapsed_ms()),
                                     observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace outflow::service
