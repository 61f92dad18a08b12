// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_RETRY_POLICY_HPP
#define FERRY_RETRY_POLICY_HPP

#include <chrono>
#include <exception>
#include <functional>

namespace ferry {
namespace transfer {

/**
 * Retry limits, backoff shape and failure classification.
 *
 * Delay formula: initial_delay * (backoff_multiplier ^ attempt), capped at
 * max_delay. With use_exponential_backoff off every delay is initial_delay.
 */
struct RetryPolicy {
  using RetryablePredicate = std::function<bool(const std::exception_ptr&)>;

  int max_retry_count = 3;
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  double backoff_multiplier = 2.0;
  bool use_exponential_backoff = true;

  // Overrides defaultIsRetryable() when set
  RetryablePredicate is_retryable;

  /**
   * Delay to wait after the given failed attempt.
   *
   * @param attempt Zero-based attempt index
   * @throws std::out_of_range if attempt is negative
   */
  std::chrono::milliseconds calculateDelay(int attempt) const;

  /**
   * Classify a failure with the custom predicate, or the default one.
   */
  bool isRetryable(const std::exception_ptr& error) const;

  /**
   * Built-in classification.
   *
   * Authentication, build and profile validation failures are permanent.
   * Connection and deployment errors carry their own transient/retryable
   * flag. Timeouts, socket errno values and stream I/O failures are
   * transient. Anything else is permanent.
   */
  static bool defaultIsRetryable(const std::exception_ptr& error);

  /**
   * Policy that runs the operation exactly once.
   */
  static RetryPolicy noRetry();
};

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_RETRY_POLICY_HPP
