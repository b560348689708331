#pragma once

#include <atomic>
#include <string>

#include "internal/util/errors.hpp"

namespace outflow::util {

/*
  Cooperative cancellation flag shared between a caller and a running
  operation. Operations check it right before commit.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

inline void ThrowIfCancelled(const CancellationToken* token, const std::string& context) {
  if (token != nullptr && token->IsCancelled()) {
    throw Cancelled(context + ": operation cancelled before commit");
  }
}

} // namespace outflow::util
