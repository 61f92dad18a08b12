// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_policy.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <ios>
#include <stdexcept>
#include <system_error>

#include "cancellation_token.hpp"
#include "ferry_errors.hpp"

namespace ferry {
namespace transfer {

namespace {

bool isTransientErrno(const std::error_code& code) {
  if (code.category() != std::generic_category() && code.category() != std::system_category()) {
    return false;
  }
  switch (code.value()) {
    case ETIMEDOUT:
    case ECONNRESET:
    case ECONNREFUSED:
    case ECONNABORTED:
    case EPIPE:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case ENETDOWN:
    case EAGAIN:
    case EIO:
      return true;
    default:
      return false;
  }
}

}  // namespace

std::chrono::milliseconds RetryPolicy::calculateDelay(int attempt) const {
  if (attempt < 0) {
    throw std::out_of_range("Attempt number must be non-negative.");
  }

  if (!use_exponential_backoff) {
    return initial_delay;
  }

  double delay_ms = static_cast<double>(initial_delay.count()) *
                    std::pow(backoff_multiplier, static_cast<double>(attempt));
  delay_ms = std::min(delay_ms, static_cast<double>(max_delay.count()));

  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

bool RetryPolicy::isRetryable(const std::exception_ptr& error) const {
  if (is_retryable) {
    return is_retryable(error);
  }
  return defaultIsRetryable(error);
}

bool RetryPolicy::defaultIsRetryable(const std::exception_ptr& error) {
  if (!error) {
    return false;
  }

  try {
    std::rethrow_exception(error);
  } catch (const OperationCancelled&) {
    return false;
  } catch (const AuthenticationError&) {
    return false;
  } catch (const BuildError&) {
    return false;
  } catch (const ProfileValidationError&) {
    return false;
  } catch (const ConnectionError& e) {
    return e.isTransient();
  } catch (const DeploymentError& e) {
    return e.isRetryable();
  } catch (const TimeoutError&) {
    return true;
  } catch (const std::ios_base::failure&) {
    return true;
  } catch (const std::system_error& e) {
    return isTransientErrno(e.code());
  } catch (const std::exception&) {
    return false;
  } catch (...) {
    // Non-standard exception types carry no classification.
    return false;
  }
}

RetryPolicy RetryPolicy::noRetry() {
  RetryPolicy policy;
  policy.max_retry_count = 0;
  return policy;
}

}  // namespace transfer
}  // namespace ferry
