// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_handler.hpp"

#include <cstdio>
#include <thread>

#include "ferry_errors.hpp"

#define FERRY_LOG_COMPONENT "retry_handler"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace transfer {

namespace {

std::string formatSeconds(std::chrono::milliseconds delay) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(delay.count()) / 1000.0);
  return buf;
}

}  // namespace

std::string describeException(const std::exception_ptr& error) {
  if (!error) {
    return "no error";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

bool defaultRetrySleep(std::chrono::milliseconds delay, const CancellationToken* token) {
  if (token) {
    return token->waitFor(delay);
  }
  std::this_thread::sleep_for(delay);
  return false;
}

RetryHandler::RetryHandler(RetryPolicy policy)
    : policy_(std::move(policy))
    , sleep_(&defaultRetrySleep) {
  if (policy_.max_retry_count < 0) {
    throw ConfigurationError("Max retry count must not be negative.");
  }
}

void RetryHandler::logAttempt(const std::string& name, int attempt, int total_attempts) {
  FERRY_LOG_DEBUG("Executing " << name << " (Attempt " << attempt << "/" << total_attempts << ")");
}

void RetryHandler::logExhausted(
  const std::string& name, int total_attempts, const std::exception_ptr& error
) {
  FERRY_LOG_ERROR(
    "All " << total_attempts << " retry attempts exhausted for " << name
           << ". Last error: " << describeException(error)
  );
}

void RetryHandler::logNotRetryable(const std::string& name, const std::exception_ptr& error) {
  FERRY_LOG_WARN(
    "Exception is not retryable. Aborting retry attempts for " << name << ": "
                                                               << describeException(error)
  );
}

void RetryHandler::logRetrying(
  const std::string& name, int attempt, int max_retries, std::chrono::milliseconds delay,
  const std::exception_ptr& error
) {
  FERRY_LOG_WARN(
    "Transient error on attempt " << attempt << "/" << max_retries << " for " << name
                                  << ". Retrying in " << formatSeconds(delay)
                                  << ". Error: " << describeException(error)
  );
}

}  // namespace transfer
}  // namespace ferry
