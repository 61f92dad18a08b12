// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ConcurrentTransferEngine
 *
 * Uses in-memory fake clients and gmock clients, so no server is needed.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

#include "concurrent_transfer_engine.hpp"
#include "concurrent_transfer_engine_test_helpers.hpp"
#include "ferry_errors.hpp"
#include "transfer_mocks.hpp"

using namespace ferry;
using namespace ferry::transfer;
using namespace ferry::transfer::test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

TransferTask makeTask(const std::string& name, uint64_t size) {
  TransferTask task;
  task.local_path = "/publish/" + name;
  task.remote_path = "/site/" + name;
  task.size = size;
  return task;
}

ConnectionConfig testConnection() {
  ConnectionConfig config;
  config.host = "web01.example.com";
  config.username = "deploy";
  config.password = "secret";
  return config;
}

}  // namespace

class ConcurrentTransferEngineTest : public ::testing::Test {
protected:
  std::unique_ptr<ConcurrentTransferEngine> makeEngine(int concurrency, int retries = 3) {
    EngineConfig config;
    config.max_concurrency = concurrency;
    config.max_retries = retries;
    auto engine = std::make_unique<ConcurrentTransferEngine>(factory_, testConnection(), config);
    engine->setSleepFunction([this](std::chrono::milliseconds delay, const CancellationToken*) {
      std::lock_guard<std::mutex> lock(sleep_mutex_);
      sleeps_.push_back(delay);
      return false;
    });
    return engine;
  }

  FakeTransferClientFactory factory_;
  std::mutex sleep_mutex_;
  std::vector<std::chrono::milliseconds> sleeps_;
};

// ============================================================================
// Configuration
// ============================================================================

TEST_F(ConcurrentTransferEngineTest, RejectsConcurrencyOutOfRange) {
  for (int concurrency : {0, -1, 21}) {
    EngineConfig config;
    config.max_concurrency = concurrency;
    EXPECT_THROW(
      ConcurrentTransferEngine engine(factory_, testConnection(), config), ConfigurationError
    ) << "concurrency=" << concurrency;
  }
}

TEST_F(ConcurrentTransferEngineTest, RejectsRetriesOutOfRange) {
  for (int retries : {-1, 11}) {
    EngineConfig config;
    config.max_retries = retries;
    EXPECT_THROW(
      ConcurrentTransferEngine engine(factory_, testConnection(), config), ConfigurationError
    ) << "retries=" << retries;
  }
}

TEST_F(ConcurrentTransferEngineTest, AcceptsBoundaryValues) {
  for (int concurrency : {1, 20}) {
    EngineConfig config;
    config.max_concurrency = concurrency;
    config.max_retries = concurrency == 1 ? 0 : 10;
    EXPECT_NO_THROW(ConcurrentTransferEngine engine(factory_, testConnection(), config));
  }
}

TEST_F(ConcurrentTransferEngineTest, EmptyTaskListReturnsNothing) {
  auto engine = makeEngine(4);
  EXPECT_TRUE(engine->uploadAll({}).empty());
  EXPECT_EQ(factory_.stats.created.load(), 0);
  EXPECT_EQ(engine->state(), EngineState::Idle);
}

// ============================================================================
// Uploads
// ============================================================================

TEST_F(ConcurrentTransferEngineTest, SingleWorkerUploadsSmallestFirst) {
  auto engine = makeEngine(1);

  std::vector<TransferTask> tasks;
  for (int kb : {7, 3, 10, 1, 5, 9, 2, 8, 4, 6}) {
    tasks.push_back(makeTask("file" + std::to_string(kb) + ".bin", kb * 1024u));
  }

  auto results = engine->uploadAll(tasks);
  ASSERT_EQ(results.size(), 10u);
  EXPECT_EQ(engine->state(), EngineState::Completed);

  std::vector<std::string> expected;
  for (int kb = 1; kb <= 10; ++kb) {
    expected.push_back("/site/file" + std::to_string(kb) + ".bin");
  }
  EXPECT_EQ(factory_.stats.uploaded_paths, expected);
  for (const auto& result : results) {
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.retry_attempts, 0);
  }
}

TEST_F(ConcurrentTransferEngineTest, OneResultPerTaskWithManyWorkers) {
  auto engine = makeEngine(4);

  std::vector<TransferTask> tasks;
  for (int i = 0; i < 50; ++i) {
    tasks.push_back(makeTask("f" + std::to_string(i), 100u + static_cast<uint64_t>(i)));
  }

  auto results = engine->uploadAll(tasks);
  ASSERT_EQ(results.size(), tasks.size());

  std::vector<std::string> remote;
  for (const auto& result : results) {
    remote.push_back(result.task.remote_path);
  }
  std::sort(remote.begin(), remote.end());
  EXPECT_EQ(std::unique(remote.begin(), remote.end()), remote.end());

  EXPECT_LE(factory_.stats.created.load(), 4);
  EXPECT_LE(factory_.stats.peak_live.load(), 4);
}

TEST_F(ConcurrentTransferEngineTest, FailingFileRetriedWithBackoff) {
  FakeTransferClientFactory failing_factory({"/site/bad.dll"});
  EngineConfig config;
  config.max_concurrency = 1;
  config.max_retries = 3;
  ConcurrentTransferEngine engine(failing_factory, testConnection(), config);

  std::vector<std::chrono::milliseconds> sleeps;
  engine.setSleepFunction([&](std::chrono::milliseconds delay, const CancellationToken*) {
    sleeps.push_back(delay);
    return false;
  });

  auto results = engine.uploadAll({makeTask("bad.dll", 10)});
  ASSERT_EQ(results.size(), 1u);

  const auto& result = results[0];
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.status, TransferStatus::Failed);
  EXPECT_EQ(result.retry_attempts, 3);
  EXPECT_THROW(std::rethrow_exception(result.error), FileTransferError);
  EXPECT_EQ(failing_factory.stats.uploads.load(), 4);

  ASSERT_EQ(sleeps.size(), 3u);
  EXPECT_EQ(sleeps[0], std::chrono::seconds(1));
  EXPECT_EQ(sleeps[1], std::chrono::seconds(2));
  EXPECT_EQ(sleeps[2], std::chrono::seconds(4));
}

TEST_F(ConcurrentTransferEngineTest, FailedFileDoesNotStopOthers) {
  FakeTransferClientFactory failing_factory({"/site/bad.dll"});
  EngineConfig config;
  config.max_concurrency = 2;
  config.max_retries = 0;
  ConcurrentTransferEngine engine(failing_factory, testConnection(), config);

  auto results =
    engine.uploadAll({makeTask("a.dll", 1), makeTask("bad.dll", 2), makeTask("c.dll", 3)});
  ASSERT_EQ(results.size(), 3u);

  const auto progress = engine.progress();
  EXPECT_EQ(progress.successful_files, 2);
  EXPECT_EQ(progress.failed_files, 1);
  EXPECT_EQ(progress.completed_files, 3);
}

TEST_F(ConcurrentTransferEngineTest, ProgressReported) {
  auto engine = makeEngine(2);

  std::mutex mutex;
  std::vector<TransferProgress> snapshots;
  int file_events = 0;
  engine->setProgressCallback([&](const TransferProgress& progress) {
    std::lock_guard<std::mutex> lock(mutex);
    snapshots.push_back(progress);
  });
  engine->setFileTransferredCallback([&](const TransferResult&) {
    std::lock_guard<std::mutex> lock(mutex);
    ++file_events;
  });

  std::vector<TransferTask> tasks;
  uint64_t total = 0;
  for (int i = 1; i <= 8; ++i) {
    tasks.push_back(makeTask("f" + std::to_string(i), static_cast<uint64_t>(i) * 100));
    total += static_cast<uint64_t>(i) * 100;
  }
  engine->uploadAll(tasks);

  EXPECT_EQ(file_events, 8);
  ASSERT_EQ(snapshots.size(), 9u);
  EXPECT_EQ(snapshots.front().completed_files, 0);
  EXPECT_EQ(snapshots.front().total_files, 8);
  EXPECT_EQ(snapshots.front().total_bytes, total);

  const auto final_progress = engine->progress();
  EXPECT_EQ(final_progress.completed_files, 8);
  EXPECT_EQ(final_progress.uploaded_bytes, total);
  EXPECT_EQ(final_progress.pending_files, 0);
  EXPECT_DOUBLE_EQ(final_progress.progressPercentage(), 100.0);
  EXPECT_TRUE(final_progress.isComplete());
}

TEST_F(ConcurrentTransferEngineTest, ProgressCallbackCanReadEngineProgress) {
  auto engine = makeEngine(1);

  std::vector<int> completed_seen;
  engine->setProgressCallback([&](const TransferProgress& progress) {
    const auto current = engine->progress();
    EXPECT_EQ(current.total_files, progress.total_files);
    completed_seen.push_back(current.completed_files);
  });

  auto results = engine->uploadAll({makeTask("a", 1), makeTask("b", 2), makeTask("c", 3)});

  EXPECT_EQ(results.size(), 3u);
  EXPECT_EQ(completed_seen, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(ConcurrentTransferEngineTest, CallbacksSerializedAndOrderedAcrossWorkers) {
  auto engine = makeEngine(4);

  std::vector<int> completed_seen;
  int file_events = 0;
  engine->setFileTransferredCallback([&](const TransferResult&) {
    EXPECT_GE(engine->progress().completed_files, 1);
    ++file_events;
  });
  engine->setProgressCallback([&](const TransferProgress& progress) {
    EXPECT_GE(engine->progress().completed_files, progress.completed_files);
    completed_seen.push_back(progress.completed_files);
  });

  std::vector<TransferTask> tasks;
  for (int i = 0; i < 40; ++i) {
    tasks.push_back(makeTask("f" + std::to_string(i), static_cast<uint64_t>(i + 1)));
  }
  engine->uploadAll(tasks);

  EXPECT_EQ(file_events, 40);
  ASSERT_EQ(completed_seen.size(), 41u);
  for (int i = 0; i <= 40; ++i) {
    EXPECT_EQ(completed_seen[static_cast<size_t>(i)], i);
  }
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(ConcurrentTransferEngineTest, PreCancelledTokenThrows) {
  auto engine = makeEngine(2);
  CancellationToken token;
  token.cancel();

  EXPECT_THROW(engine->uploadAll({makeTask("a", 1)}, &token), OperationCancelled);
  EXPECT_EQ(factory_.stats.uploads.load(), 0);
}

TEST_F(ConcurrentTransferEngineTest, CancelMidRunReturnsPartialResults) {
  auto engine = makeEngine(1);
  CancellationToken token;
  engine->setFileTransferredCallback([&](const TransferResult&) { token.cancel(); });

  std::vector<TransferTask> tasks;
  for (int i = 0; i < 5; ++i) {
    tasks.push_back(makeTask("f" + std::to_string(i), static_cast<uint64_t>(i + 1)));
  }

  auto results = engine->uploadAll(tasks, &token);
  EXPECT_EQ(results.size(), 1u);
  EXPECT_EQ(engine->state(), EngineState::Cancelled);
}

// ============================================================================
// Connections
// ============================================================================

TEST_F(ConcurrentTransferEngineTest, DisposeReleasesEveryConnection) {
  auto engine = makeEngine(3);

  std::vector<TransferTask> tasks;
  for (int i = 0; i < 12; ++i) {
    tasks.push_back(makeTask("f" + std::to_string(i), 10));
  }
  engine->uploadAll(tasks);
  EXPECT_GT(factory_.stats.live.load(), 0);

  engine->dispose();
  EXPECT_EQ(factory_.stats.live.load(), 0);
  EXPECT_EQ(factory_.stats.disposed.load(), factory_.stats.created.load());

  EXPECT_NO_THROW(engine->dispose());
  EXPECT_EQ(factory_.stats.disposed.load(), factory_.stats.created.load());
}

TEST_F(ConcurrentTransferEngineTest, ConnectionsReusedAcrossRuns) {
  auto engine = makeEngine(1);
  engine->uploadAll({makeTask("a", 1)});
  engine->uploadAll({makeTask("b", 1)});

  EXPECT_EQ(factory_.stats.created.load(), 1);
}

TEST_F(ConcurrentTransferEngineTest, WorkerConnectFailurePropagates) {
  MockTransferClientFactory factory;
  EXPECT_CALL(factory, createClient(_)).WillOnce([](const ConnectionConfig& config) {
    auto client = std::make_unique<NiceMock<MockTransferClient>>();
    EXPECT_CALL(*client, connect(_))
      .WillOnce(Throw(ConnectionRefusedError(config.host, config.port)));
    return std::unique_ptr<ITransferClient>(std::move(client));
  });

  EngineConfig config;
  config.max_concurrency = 1;
  ConcurrentTransferEngine engine(factory, testConnection(), config);

  EXPECT_THROW(engine.uploadAll({makeTask("a", 1)}), ConnectionRefusedError);
  EXPECT_EQ(engine.state(), EngineState::Completed);
}

// ============================================================================
// Per-file retry helper
// ============================================================================

class UploadWithRetryTest : public ::testing::Test {
protected:
  RetrySleepFunction recordingSleep() {
    return [this](std::chrono::milliseconds delay, const CancellationToken*) {
      sleeps_.push_back(delay);
      return false;
    };
  }

  NiceMock<MockTransferClient> client_;
  std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(UploadWithRetryTest, BackoffDelays) {
  EXPECT_EQ(transferBackoffDelay(0), std::chrono::seconds(0));
  EXPECT_EQ(transferBackoffDelay(1), std::chrono::seconds(1));
  EXPECT_EQ(transferBackoffDelay(2), std::chrono::seconds(2));
  EXPECT_EQ(transferBackoffDelay(3), std::chrono::seconds(4));
  EXPECT_EQ(transferBackoffDelay(5), std::chrono::seconds(16));
}

TEST_F(UploadWithRetryTest, ReconnectsDroppedClient) {
  EXPECT_CALL(client_, isConnected()).WillOnce(Return(false));
  EXPECT_CALL(client_, connect(_)).Times(1);
  EXPECT_CALL(client_, uploadFile("/publish/a", "/site/a", true, true, _))
    .WillOnce(Return(true));

  auto result = uploadWithRetryImpl(client_, makeTask("a", 1), 3, nullptr, recordingSleep());
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(UploadWithRetryTest, SucceedsAfterTransientFailure) {
  ON_CALL(client_, isConnected()).WillByDefault(Return(true));
  EXPECT_CALL(client_, uploadFile(_, _, _, _, _))
    .WillOnce(Throw(FileTransferError("/publish/a", "/site/a")))
    .WillOnce(Return(true));

  auto result = uploadWithRetryImpl(client_, makeTask("a", 1), 3, nullptr, recordingSleep());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.retry_attempts, 1);
  ASSERT_EQ(sleeps_.size(), 1u);
  EXPECT_EQ(sleeps_[0], std::chrono::seconds(1));
}

TEST_F(UploadWithRetryTest, DeclinedUploadIsNotRetried) {
  ON_CALL(client_, isConnected()).WillByDefault(Return(true));
  EXPECT_CALL(client_, uploadFile(_, _, _, _, _)).WillOnce(Return(false));

  auto result = uploadWithRetryImpl(client_, makeTask("a", 1), 3, nullptr, recordingSleep());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.status, TransferStatus::Failed);
  EXPECT_EQ(result.retry_attempts, 0);
}

TEST_F(UploadWithRetryTest, ZeroRetriesMeansOneAttempt) {
  ON_CALL(client_, isConnected()).WillByDefault(Return(true));
  EXPECT_CALL(client_, uploadFile(_, _, _, _, _))
    .WillOnce(Throw(FileTransferError("/publish/a", "/site/a")));

  auto result = uploadWithRetryImpl(client_, makeTask("a", 1), 0, nullptr, recordingSleep());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.retry_attempts, 0);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(UploadWithRetryTest, CancelledDuringBackoff) {
  ON_CALL(client_, isConnected()).WillByDefault(Return(true));
  EXPECT_CALL(client_, uploadFile(_, _, _, _, _))
    .WillOnce(Throw(FileTransferError("/publish/a", "/site/a")));

  CancellationToken token;
  auto cancelling_sleep = [&](std::chrono::milliseconds, const CancellationToken*) {
    token.cancel();
    return true;
  };

  auto result = uploadWithRetryImpl(client_, makeTask("a", 1), 3, &token, cancelling_sleep);
  EXPECT_EQ(result.status, TransferStatus::Cancelled);
}

TEST_F(UploadWithRetryTest, CancelledUploadIsNotRetried) {
  ON_CALL(client_, isConnected()).WillByDefault(Return(true));
  EXPECT_CALL(client_, uploadFile(_, _, _, _, _)).WillOnce(Throw(OperationCancelled()));

  auto result = uploadWithRetryImpl(client_, makeTask("a", 1), 3, nullptr, recordingSleep());
  EXPECT_EQ(result.status, TransferStatus::Cancelled);
  EXPECT_TRUE(sleeps_.empty());
}
