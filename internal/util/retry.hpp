#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <thread>

#include "internal/util/errors.hpp"

namespace outflow::util {

inline bool IsStaleState(const std::exception& e) {
  return dynamic_cast<const StaleState*>(&e) != nullptr;
}

/*
  Exponential backoff for optimistic-concurrency conflicts.

  Only errors accepted by `retryable` are retried; everything else escapes on
  the first throw. After max_attempts the last error escapes unchanged.
*/
struct RetryPolicy {
  uint32_t                                   max_attempts    = 5;
  std::chrono::milliseconds                  initial_backoff = std::chrono::milliseconds(2);
  std::chrono::milliseconds                  max_backoff     = std::chrono::milliseconds(50);
  double                                     multiplier      = 2.0;
  std::function<bool(const std::exception&)> retryable       = IsStaleState;
};

template <typename Fn>
auto WithRetry(const RetryPolicy& policy, Fn&& fn) -> decltype(fn()) {
  auto backoff = policy.initial_backoff;
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const std::exception& e) {
      if (attempt >= policy.max_attempts || !policy.retryable || !policy.retryable(e)) {
        throw;
      }
    }

    std::this_thread::sleep_for(backoff);
    const auto next = std::chrono::duration_cast<std::chrono::milliseconds>(backoff * policy.multiplier);
    backoff         = std::min(policy.max_backoff, std::max(next, std::chrono::milliseconds(1)));
  }
}

} // namespace outflow::util
