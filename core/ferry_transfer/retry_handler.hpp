// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_RETRY_HANDLER_HPP
#define FERRY_RETRY_HANDLER_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <string>
#include <type_traits>
#include <utility>

#include "cancellation_token.hpp"
#include "retry_policy.hpp"

namespace ferry {
namespace transfer {

namespace detail {

template<typename T>
struct unwrap_future {
  using type = T;
  static constexpr bool is_future = false;
};

template<typename T>
struct unwrap_future<std::future<T>> {
  using type = T;
  static constexpr bool is_future = true;
};

}  // namespace detail

/**
 * Waits between attempts. Returns true when the wait ended because the token
 * was cancelled.
 */
using RetrySleepFunction =
  std::function<bool(std::chrono::milliseconds delay, const CancellationToken* token)>;

/**
 * Sleeps on the token when one is given, otherwise on the calling thread.
 */
bool defaultRetrySleep(std::chrono::milliseconds delay, const CancellationToken* token);

/**
 * Runs an operation under a RetryPolicy.
 *
 * The operation is a callable returning void, a value, or a std::future of
 * either. Futures are waited on inside the attempt so their failures are
 * classified like synchronous ones. Up to max_retry_count + 1 attempts are
 * made. A failure the policy does not consider retryable is rethrown at once.
 * When every attempt fails the last failure is rethrown. Cancellation during
 * a backoff wait raises OperationCancelled.
 *
 * Usage:
 *   RetryHandler retry(policy);
 *   retry.execute([&] { client->connect(&token); }, "Connect", &token);
 */
class RetryHandler {
public:
  /**
   * @throws ConfigurationError if policy.max_retry_count is negative
   */
  explicit RetryHandler(RetryPolicy policy = {});

  template<typename Operation>
  auto execute(
    Operation&& operation, const std::string& operation_name = "Operation",
    const CancellationToken* token = nullptr
  ) -> typename detail::unwrap_future<std::invoke_result_t<Operation&>>::type {
    using Result = typename detail::unwrap_future<std::invoke_result_t<Operation&>>::type;

    const int total_attempts = policy_.max_retry_count + 1;
    std::exception_ptr last_error;

    for (int attempt = 0; attempt < total_attempts; ++attempt) {
      if (token) {
        token->throwIfCancelled();
      }
      logAttempt(operation_name, attempt + 1, total_attempts);

      try {
        return invokeOnce<Result>(operation);
      } catch (const OperationCancelled&) {
        throw;
      } catch (...) {
        last_error = std::current_exception();
      }

      if (attempt == total_attempts - 1) {
        logExhausted(operation_name, total_attempts, last_error);
        std::rethrow_exception(last_error);
      }

      if (!policy_.isRetryable(last_error)) {
        logNotRetryable(operation_name, last_error);
        std::rethrow_exception(last_error);
      }

      const auto delay = policy_.calculateDelay(attempt);
      logRetrying(operation_name, attempt + 1, policy_.max_retry_count, delay, last_error);
      if (sleep_(delay, token)) {
        throw OperationCancelled("Retry of " + operation_name + " was cancelled.");
      }
    }

    std::rethrow_exception(last_error);
  }

  const RetryPolicy& policy() const { return policy_; }

  /**
   * Replace the backoff wait. Tests use this to record delays without
   * sleeping.
   */
  void setSleepFunction(RetrySleepFunction sleep) { sleep_ = std::move(sleep); }

private:
  template<typename Result, typename Operation>
  static Result invokeOnce(Operation& operation) {
    if constexpr (detail::unwrap_future<std::invoke_result_t<Operation&>>::is_future) {
      return operation().get();
    } else {
      return operation();
    }
  }

  static void logAttempt(const std::string& name, int attempt, int total_attempts);
  static void logExhausted(
    const std::string& name, int total_attempts, const std::exception_ptr& error
  );
  static void logNotRetryable(const std::string& name, const std::exception_ptr& error);
  static void logRetrying(
    const std::string& name, int attempt, int max_retries, std::chrono::milliseconds delay,
    const std::exception_ptr& error
  );

  RetryPolicy policy_;
  RetrySleepFunction sleep_;
};

/**
 * Human-readable message of a captured exception.
 */
std::string describeException(const std::exception_ptr& error);

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_RETRY_HANDLER_HPP
