// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONCURRENT_TRANSFER_ENGINE_TEST_HELPERS_HPP
#define FERRY_CONCURRENT_TRANSFER_ENGINE_TEST_HELPERS_HPP

// Exposes engine internals for dependency injection in tests.

#include "concurrent_transfer_engine.hpp"

namespace ferry {
namespace transfer {

/**
 * Upload one task on an already leased client.
 *
 * Makes up to max_retries + 1 attempts. Every exception is retried after
 * 2^(attempt-1) seconds, waited through sleep. A client returning false
 * ends the task without retrying.
 *
 * @param client Leased client, reconnected between attempts if it dropped
 * @param task Task to upload
 * @param max_retries Extra attempts after the first
 * @param token Optional cancellation token
 * @param sleep Backoff wait, returns true when cancelled
 * @return Result with retry_attempts = attempts made - 1
 */
TransferResult uploadWithRetryImpl(
  ITransferClient& client, const TransferTask& task, int max_retries,
  const CancellationToken* token, const RetrySleepFunction& sleep
);

/**
 * Backoff before retry number `attempt` (1-based): 1s, 2s, 4s...
 */
std::chrono::seconds transferBackoffDelay(int attempt);

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_CONCURRENT_TRANSFER_ENGINE_TEST_HELPERS_HPP
