// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONNECTION_POOL_HPP
#define FERRY_CONNECTION_POOL_HPP

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

#include "cancellation_token.hpp"
#include "transfer_client.hpp"

namespace ferry {
namespace transfer {

/**
 * Bag of idle clients plus a counting semaphore that caps how many clients
 * may be in use at once.
 *
 * A worker holds one permit for as long as it owns a client. Idle clients
 * are handed out in LIFO order. After dispose() returned clients are
 * disposed immediately instead of pooled.
 *
 * Thread-safe.
 */
class ConnectionPool {
public:
  /**
   * @throws ConfigurationError if max_connections < 1
   */
  explicit ConnectionPool(int max_connections);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Block until a permit is free.
   *
   * @return false if token was cancelled before a permit became free
   */
  bool acquirePermit(const CancellationToken* token);

  void releasePermit();

  int availablePermits() const;

  /**
   * Permits currently held.
   */
  int activeCount() const;

  int maxConnections() const { return max_connections_; }

  /**
   * Most recently returned idle client, or nullptr when the bag is empty.
   */
  std::unique_ptr<ITransferClient> takeIdle();

  void returnClient(std::unique_ptr<ITransferClient> client);

  size_t idleCount() const;

  /**
   * Dispose every idle client. Idempotent.
   */
  void dispose();

  bool isDisposed() const;

private:
  const int max_connections_;

  mutable std::mutex mutex_;
  std::condition_variable permit_cv_;
  int available_;
  std::deque<std::unique_ptr<ITransferClient>> idle_;
  bool disposed_ = false;
};

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_CONNECTION_POOL_HPP
