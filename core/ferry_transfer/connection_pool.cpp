// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "connection_pool.hpp"

#include <chrono>
#include <exception>
#include <vector>

#include "ferry_errors.hpp"

#define FERRY_LOG_COMPONENT "connection_pool"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace transfer {

namespace {

// Cancellation is signalled on the token's own condition variable, so permit
// waits re-check it at this interval.
constexpr std::chrono::milliseconds kPermitPollInterval{100};

void disposeQuietly(ITransferClient& client) {
  try {
    client.dispose();
  } catch (const std::exception& e) {
    FERRY_LOG_WARN("Failed to dispose transfer client" << ::ferry::logging::kv("error", e.what()));
  }
}

}  // namespace

ConnectionPool::ConnectionPool(int max_connections)
    : max_connections_(max_connections)
    , available_(max_connections) {
  if (max_connections < 1) {
    throw ConfigurationError("Connection pool size must be at least 1.");
  }
}

ConnectionPool::~ConnectionPool() {
  dispose();
}

bool ConnectionPool::acquirePermit(const CancellationToken* token) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (available_ == 0) {
    if (token && token->isCancelled()) {
      return false;
    }
    permit_cv_.wait_for(lock, kPermitPollInterval);
  }
  if (token && token->isCancelled()) {
    return false;
  }
  --available_;
  return true;
}

void ConnectionPool::releasePermit() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ < max_connections_) {
      ++available_;
    }
  }
  permit_cv_.notify_one();
}

int ConnectionPool::availablePermits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

int ConnectionPool::activeCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return max_connections_ - available_;
}

std::unique_ptr<ITransferClient> ConnectionPool::takeIdle() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (idle_.empty()) {
    return nullptr;
  }
  auto client = std::move(idle_.back());
  idle_.pop_back();
  return client;
}

void ConnectionPool::returnClient(std::unique_ptr<ITransferClient> client) {
  if (!client) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!disposed_) {
      idle_.push_back(std::move(client));
      return;
    }
  }
  disposeQuietly(*client);
}

size_t ConnectionPool::idleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

void ConnectionPool::dispose() {
  std::vector<std::unique_ptr<ITransferClient>> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    disposed_ = true;
    for (auto& client : idle_) {
      drained.push_back(std::move(client));
    }
    idle_.clear();
  }

  for (auto& client : drained) {
    disposeQuietly(*client);
  }
  if (!drained.empty()) {
    FERRY_LOG_DEBUG("Disposed pooled clients" << ::ferry::logging::kv("count", drained.size()));
  }
}

bool ConnectionPool::isDisposed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return disposed_;
}

}  // namespace transfer
}  // namespace ferry
