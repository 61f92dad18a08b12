// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cancellation_token.hpp"

namespace ferry {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

void CancellationToken::throwIfCancelled() const {
  if (cancelled_.load()) {
    throw OperationCancelled();
  }
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
}

void CancellationToken::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_.store(false);
}

}  // namespace ferry
