// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CANCELLATION_TOKEN_HPP
#define FERRY_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

namespace ferry {

/**
 * Raised when a cooperative cancellation request is observed.
 * Distinct from every operation error so that retry loops never retry it.
 */
class OperationCancelled : public std::runtime_error {
public:
  explicit OperationCancelled(const std::string& message = "The operation was cancelled.")
      : std::runtime_error(message) {}
};

/**
 * Shared cancellation flag with interruptible waits.
 *
 * One token is handed down through the orchestrator, retry handler, transfer
 * engine and transfer clients. Holders poll isCancelled() at loop boundaries
 * and use waitFor() instead of sleeping so that backoff delays end as soon as
 * cancel() is called.
 *
 * Thread-safe.
 */
class CancellationToken {
public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  /**
   * Request cancellation and wake every waiter. Idempotent.
   */
  void cancel();

  bool isCancelled() const { return cancelled_.load(); }

  /**
   * Throw OperationCancelled if cancellation was requested.
   */
  void throwIfCancelled() const;

  /**
   * Block for up to timeout.
   *
   * @return true if cancelled before or during the wait
   */
  bool waitFor(std::chrono::milliseconds timeout) const;

  /**
   * Clear the flag so the token can guard another run.
   */
  void reset();

private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

}  // namespace ferry

#endif  // FERRY_CANCELLATION_TOKEN_HPP
