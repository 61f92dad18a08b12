// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONCURRENT_TRANSFER_ENGINE_HPP
#define FERRY_CONCURRENT_TRANSFER_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "cancellation_token.hpp"
#include "connection_pool.hpp"
#include "retry_handler.hpp"
#include "transfer_client.hpp"
#include "transfer_queue.hpp"
#include "transfer_types.hpp"

namespace ferry {
namespace transfer {

/**
 * Engine limits. Validated by the engine constructor.
 */
struct EngineConfig {
  int max_concurrency = 4;  // 1..20 workers and pooled connections
  int max_retries = 3;      // 0..10 extra attempts per file
};

enum class EngineState { Idle, Running, Completed, Cancelled };

const char* engineStateToString(EngineState state);

using ProgressCallback = std::function<void(const TransferProgress& progress)>;
using FileTransferredCallback = std::function<void(const TransferResult& result)>;

/**
 * Concurrent Transfer Engine - uploads many files over pooled connections
 *
 * Features:
 * - Exactly max_concurrency worker threads per uploadAll() call
 * - At most max_concurrency live connections, reused across calls
 * - Queue ordered by priority, then size, so small files finish first
 * - Per-file retry with fixed 1s, 2s, 4s... backoff
 * - Aggregate progress published after every file
 *
 * Usage:
 *   ConcurrentTransferEngine engine(factory, connection, {8, 3});
 *   engine.setProgressCallback([](const TransferProgress& p) { ... });
 *   auto results = engine.uploadAll(tasks, &token);
 *   engine.dispose();
 *
 * One failed file never stops the others; its outcome is in its
 * TransferResult. A worker that cannot open a connection aborts the call
 * with that error once all workers have finished.
 */
class ConcurrentTransferEngine {
public:
  /**
   * @throws ConfigurationError if config is out of range
   */
  ConcurrentTransferEngine(
    ITransferClientFactory& factory, const ConnectionConfig& connection,
    const EngineConfig& config = {}
  );
  ~ConcurrentTransferEngine();

  ConcurrentTransferEngine(const ConcurrentTransferEngine&) = delete;
  ConcurrentTransferEngine& operator=(const ConcurrentTransferEngine&) = delete;
  ConcurrentTransferEngine(ConcurrentTransferEngine&&) = delete;
  ConcurrentTransferEngine& operator=(ConcurrentTransferEngine&&) = delete;

  /**
   * Upload every task and return one result per processed task, in
   * completion order.
   *
   * When token is cancelled mid-run the workers stop picking up new tasks
   * and the results gathered so far are returned.
   *
   * @throws OperationCancelled if token is already cancelled on entry
   * @throws std::logic_error if another uploadAll() is in progress
   * @throws the first connection error raised by a worker
   */
  std::vector<TransferResult> uploadAll(
    const std::vector<TransferTask>& tasks, const CancellationToken* token = nullptr
  );

  /**
   * Subscribers get a consistent progress snapshot. Calls are made one at a
   * time from worker threads, in the order the snapshots were taken, and
   * outside the progress lock, so a subscriber may read progress().
   */
  void setProgressCallback(ProgressCallback callback);
  void setFileTransferredCallback(FileTransferredCallback callback);

  /**
   * Replace the per-file backoff wait.
   */
  void setSleepFunction(RetrySleepFunction sleep);

  TransferProgress progress() const;
  EngineState state() const { return state_.load(); }
  const EngineConfig& config() const { return config_; }

  /**
   * Dispose every pooled connection. Idempotent; also run by the destructor.
   */
  void dispose();

private:
  void workerLoop(int worker_id, TransferQueue& queue, const CancellationToken* token);

  std::unique_ptr<ITransferClient> acquireClient(const CancellationToken* token);
  void releaseClient(std::unique_ptr<ITransferClient> client);

  void initializeProgress(const std::vector<TransferTask>& tasks);
  void recordResult(const TransferResult& result);
  void recomputeProgressLocked();
  void notifySubscribers(
    const TransferProgress& snapshot, uint64_t sequence, const TransferResult* result
  );

  ITransferClientFactory& factory_;
  ConnectionConfig connection_;
  EngineConfig config_;
  std::unique_ptr<ConnectionPool> pool_;

  std::atomic<EngineState> state_{EngineState::Idle};
  std::atomic<bool> running_{false};
  std::atomic<bool> disposed_{false};

  // Guards progress, results and callbacks
  mutable std::mutex progress_mutex_;
  TransferProgress progress_;
  uint64_t progress_sequence_ = 0;
  std::chrono::steady_clock::time_point started_steady_;
  std::vector<TransferResult> results_;
  ProgressCallback progress_callback_;
  FileTransferredCallback file_callback_;
  RetrySleepFunction sleep_;

  // Subscriber calls run outside progress_mutex_, in sequence order
  std::mutex notify_mutex_;
  std::condition_variable notify_cv_;
  uint64_t delivered_sequence_ = 0;

  std::mutex error_mutex_;
  std::exception_ptr worker_error_;
};

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_CONCURRENT_TRANSFER_ENGINE_HPP
