#pragma once

#include <atomic>

#include "pv/error.h"

namespace pv {

// Shared between the host thread and a worker running a backup operation.
// Checked at coarse points only; a running KDF is never interrupted.
class CancellationToken {
public:
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

  void ThrowIfCancelled() const {
    if (IsCancelled()) {
      throw Error(ErrorDomain::State, errors::backup::kCancelled, "Operation cancelled");
    }
  }

private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace pv
