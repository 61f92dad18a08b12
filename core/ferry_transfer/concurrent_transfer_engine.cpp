// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "concurrent_transfer_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "concurrent_transfer_engine_test_helpers.hpp"
#include "ferry_errors.hpp"

#define FERRY_LOG_COMPONENT "transfer_engine"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace transfer {

using ::ferry::logging::kv;

namespace {

constexpr int kMinConcurrency = 1;
constexpr int kMaxConcurrency = 20;
constexpr int kMinRetries = 0;
constexpr int kMaxRetries = 10;

bool isCancelled(const CancellationToken* token) {
  return token != nullptr && token->isCancelled();
}

}  // namespace

const char* engineStateToString(EngineState state) {
  switch (state) {
    case EngineState::Idle:
      return "Idle";
    case EngineState::Running:
      return "Running";
    case EngineState::Completed:
      return "Completed";
    case EngineState::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

// ============================================================================
// Per-file retry
// ============================================================================

std::chrono::seconds transferBackoffDelay(int attempt) {
  if (attempt < 1) {
    return std::chrono::seconds(0);
  }
  return std::chrono::seconds(1LL << std::min(attempt - 1, 30));
}

TransferResult uploadWithRetryImpl(
  ITransferClient& client, const TransferTask& task, int max_retries,
  const CancellationToken* token, const RetrySleepFunction& sleep
) {
  const auto started_at = Clock::now();
  int attempts = 0;
  std::exception_ptr last_error;

  while (attempts <= max_retries && !isCancelled(token)) {
    ++attempts;
    try {
      if (!client.isConnected()) {
        client.connect(token);
      }
      const bool uploaded = client.uploadFile(
        task.local_path, task.remote_path, task.overwrite, task.create_directories, token
      );
      return TransferResult::fromSuccess(task, uploaded, started_at, Clock::now(), attempts - 1);
    } catch (const OperationCancelled&) {
      return TransferResult::fromCancellation(task, started_at, Clock::now(), attempts - 1);
    } catch (const std::exception& e) {
      last_error = std::current_exception();
      FERRY_LOG_WARN(
        "Upload attempt failed" << kv("file", task.remote_path) << kv("attempt", attempts)
                                << kv("max_attempts", max_retries + 1) << kv("error", e.what())
      );
    }

    if (attempts <= max_retries) {
      const auto delay = transferBackoffDelay(attempts);
      if (sleep(std::chrono::duration_cast<std::chrono::milliseconds>(delay), token)) {
        return TransferResult::fromCancellation(task, started_at, Clock::now(), attempts - 1);
      }
    }
  }

  if (!last_error) {
    // Cancelled before the first attempt.
    return TransferResult::fromCancellation(task, started_at, Clock::now(), 0);
  }

  FERRY_LOG_ERROR(
    "Upload failed after retries" << kv("file", task.remote_path) << kv("attempts", attempts)
  );
  return TransferResult::fromFailure(task, last_error, started_at, Clock::now(), attempts - 1);
}

// ============================================================================
// ConcurrentTransferEngine
// ============================================================================

ConcurrentTransferEngine::ConcurrentTransferEngine(
  ITransferClientFactory& factory, const ConnectionConfig& connection, const EngineConfig& config
)
    : factory_(factory)
    , connection_(connection)
    , config_(config)
    , sleep_(&defaultRetrySleep) {
  if (config_.max_concurrency < kMinConcurrency || config_.max_concurrency > kMaxConcurrency) {
    throw ConfigurationError("Max concurrency must be between 1 and 20.");
  }
  if (config_.max_retries < kMinRetries || config_.max_retries > kMaxRetries) {
    throw ConfigurationError("Max retries must be between 0 and 10.");
  }
  pool_ = std::make_unique<ConnectionPool>(config_.max_concurrency);
}

ConcurrentTransferEngine::~ConcurrentTransferEngine() {
  dispose();
}

std::vector<TransferResult> ConcurrentTransferEngine::uploadAll(
  const std::vector<TransferTask>& tasks, const CancellationToken* token
) {
  if (tasks.empty()) {
    return {};
  }
  if (token) {
    token->throwIfCancelled();
  }
  if (running_.exchange(true)) {
    throw std::logic_error("uploadAll is already running on this engine.");
  }

  state_ = EngineState::Running;
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    worker_error_ = nullptr;
  }
  initializeProgress(tasks);

  TransferQueue queue(tasks);
  FERRY_LOG_INFO(
    "Starting upload" << kv("files", tasks.size()) << kv("bytes", queue.pending_bytes())
                      << kv("workers", config_.max_concurrency)
                      << kv("max_retries", config_.max_retries)
  );

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(config_.max_concurrency));
  for (int i = 0; i < config_.max_concurrency; ++i) {
    workers.emplace_back(&ConcurrentTransferEngine::workerLoop, this, i, std::ref(queue), token);
  }
  for (auto& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  const bool cancelled = isCancelled(token);
  state_ = cancelled ? EngineState::Cancelled : EngineState::Completed;

  std::vector<TransferResult> results;
  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    results.swap(results_);
  }
  running_ = false;

  std::exception_ptr worker_error;
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    worker_error = worker_error_;
  }
  if (worker_error) {
    std::rethrow_exception(worker_error);
  }

  const auto failed = std::count_if(results.begin(), results.end(), [](const TransferResult& r) {
    return !r.success;
  });
  FERRY_LOG_INFO(
    "Upload finished" << kv("state", engineStateToString(state_.load()))
                      << kv("processed", results.size()) << kv("failed", failed)
  );
  return results;
}

void ConcurrentTransferEngine::workerLoop(
  int worker_id, TransferQueue& queue, const CancellationToken* token
) {
  if (!pool_->acquirePermit(token)) {
    return;
  }

  std::unique_ptr<ITransferClient> client;
  try {
    client = acquireClient(token);

    while (!isCancelled(token)) {
      auto task = queue.try_dequeue();
      if (!task) {
        break;
      }

      RetrySleepFunction sleep;
      {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        sleep = sleep_;
      }
      recordResult(uploadWithRetryImpl(*client, *task, config_.max_retries, token, sleep));
    }
  } catch (const OperationCancelled&) {
    FERRY_LOG_DEBUG("Worker stopped by cancellation" << kv("worker", worker_id));
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR("Worker aborted" << kv("worker", worker_id) << kv("error", e.what()));
    std::lock_guard<std::mutex> lock(error_mutex_);
    if (!worker_error_) {
      worker_error_ = std::current_exception();
    }
  }

  releaseClient(std::move(client));
  pool_->releasePermit();
}

std::unique_ptr<ITransferClient> ConcurrentTransferEngine::acquireClient(
  const CancellationToken* token
) {
  auto client = pool_->takeIdle();
  if (client && client->isConnected()) {
    return client;
  }
  if (client) {
    try {
      client->dispose();
    } catch (const std::exception& e) {
      FERRY_LOG_WARN("Failed to dispose stale client" << kv("error", e.what()));
    }
  }

  client = factory_.createClient(connection_);
  if (!client) {
    throw ConfigurationError("Transfer client factory returned no client.");
  }
  client->connect(token);
  return client;
}

void ConcurrentTransferEngine::releaseClient(std::unique_ptr<ITransferClient> client) {
  if (!client) {
    return;
  }
  if (client->isConnected()) {
    pool_->returnClient(std::move(client));
    return;
  }
  try {
    client->dispose();
  } catch (const std::exception& e) {
    FERRY_LOG_WARN("Failed to dispose dead client" << kv("error", e.what()));
  }
}

// ============================================================================
// Progress
// ============================================================================

void ConcurrentTransferEngine::initializeProgress(const std::vector<TransferTask>& tasks) {
  TransferProgress snapshot;
  uint64_t sequence = 0;
  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    results_.clear();
    results_.reserve(tasks.size());

    progress_ = TransferProgress{};
    progress_.total_files = static_cast<int>(tasks.size());
    for (const auto& task : tasks) {
      progress_.total_bytes += task.size;
    }
    progress_.started_at = Clock::now();
    started_steady_ = std::chrono::steady_clock::now();
    recomputeProgressLocked();

    snapshot = progress_;
    sequence = ++progress_sequence_;
  }
  notifySubscribers(snapshot, sequence, nullptr);
}

void ConcurrentTransferEngine::recordResult(const TransferResult& result) {
  TransferProgress snapshot;
  uint64_t sequence = 0;
  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    results_.push_back(result);

    progress_.completed_files++;
    if (result.success) {
      progress_.successful_files++;
    } else {
      progress_.failed_files++;
    }
    progress_.uploaded_bytes += result.task.size;
    recomputeProgressLocked();

    snapshot = progress_;
    sequence = ++progress_sequence_;
  }

  FERRY_LOG_DEBUG(
    "File processed" << kv("file", result.task.remote_path)
                     << kv("status", transferStatusToString(result.status))
                     << kv("retries", result.retry_attempts)
  );
  notifySubscribers(snapshot, sequence, &result);
}

void ConcurrentTransferEngine::notifySubscribers(
  const TransferProgress& snapshot, uint64_t sequence, const TransferResult* result
) {
  {
    std::unique_lock<std::mutex> lock(notify_mutex_);
    notify_cv_.wait(lock, [this, sequence] { return delivered_sequence_ + 1 == sequence; });
  }

  // Hands the turn to the next snapshot even if a subscriber throws
  struct TurnGuard {
    ConcurrentTransferEngine& engine;
    uint64_t sequence;
    ~TurnGuard() {
      {
        std::lock_guard<std::mutex> lock(engine.notify_mutex_);
        engine.delivered_sequence_ = sequence;
      }
      engine.notify_cv_.notify_all();
    }
  } guard{*this, sequence};

  ProgressCallback progress_callback;
  FileTransferredCallback file_callback;
  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_callback = progress_callback_;
    file_callback = file_callback_;
  }

  if (result != nullptr && file_callback) {
    file_callback(*result);
  }
  if (progress_callback) {
    progress_callback(snapshot);
  }
}

void ConcurrentTransferEngine::recomputeProgressLocked() {
  const double elapsed_seconds =
    std::chrono::duration<double>(std::chrono::steady_clock::now() - started_steady_).count();

  progress_.average_speed =
    elapsed_seconds > 0.0 ? static_cast<double>(progress_.uploaded_bytes) / elapsed_seconds : 0.0;
  // Recent-window rates are not tracked; the running average stands in.
  progress_.current_speed = progress_.average_speed;

  if (progress_.average_speed > 0.0) {
    const uint64_t remaining = progress_.total_bytes > progress_.uploaded_bytes
                                 ? progress_.total_bytes - progress_.uploaded_bytes
                                 : 0;
    progress_.estimated_time_remaining = std::chrono::seconds(
      static_cast<int64_t>(static_cast<double>(remaining) / progress_.average_speed)
    );
  } else {
    progress_.estimated_time_remaining.reset();
  }

  // Held permits, which includes workers that have found the queue empty
  // and are about to exit.
  progress_.active_uploads = pool_->activeCount();
  progress_.pending_files = std::max(
    0, progress_.total_files - progress_.completed_files - progress_.active_uploads
  );
}

void ConcurrentTransferEngine::setProgressCallback(ProgressCallback callback) {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  progress_callback_ = std::move(callback);
}

void ConcurrentTransferEngine::setFileTransferredCallback(FileTransferredCallback callback) {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  file_callback_ = std::move(callback);
}

void ConcurrentTransferEngine::setSleepFunction(RetrySleepFunction sleep) {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  sleep_ = std::move(sleep);
}

TransferProgress ConcurrentTransferEngine::progress() const {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  return progress_;
}

void ConcurrentTransferEngine::dispose() {
  if (disposed_.exchange(true)) {
    return;
  }
  pool_->dispose();
}

}  // namespace transfer
}  // namespace ferry
