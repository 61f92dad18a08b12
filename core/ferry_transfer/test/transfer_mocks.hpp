// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_TRANSFER_MOCKS_HPP
#define FERRY_TRANSFER_MOCKS_HPP

#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ferry_errors.hpp"
#include "transfer_client.hpp"

namespace ferry {
namespace transfer {
namespace test {

/**
 * Mock implementation of ITransferClient for testing
 */
class MockTransferClient : public ITransferClient {
public:
  MOCK_METHOD(bool, isConnected, (), (const, override));
  MOCK_METHOD(void, connect, (const CancellationToken* token), (override));
  MOCK_METHOD(void, disconnect, (), (override));
  MOCK_METHOD(
    bool, uploadFile,
    (const std::string& local_path, const std::string& remote_path, bool overwrite,
     bool create_directories, const CancellationToken* token),
    (override)
  );
  MOCK_METHOD(void, createDirectory, (const std::string& remote_path), (override));
  MOCK_METHOD(bool, directoryExists, (const std::string& remote_path), (override));
  MOCK_METHOD(bool, fileExists, (const std::string& remote_path), (override));
  MOCK_METHOD(
    std::vector<RemoteFileInfo>, listDirectory, (const std::string& remote_path), (override)
  );
  MOCK_METHOD(void, deleteFile, (const std::string& remote_path), (override));
  MOCK_METHOD(void, deleteDirectory, (const std::string& remote_path), (override));
  MOCK_METHOD(bool, testConnection, (const CancellationToken* token), (override));
  MOCK_METHOD(void, dispose, (), (override));
};

/**
 * Mock implementation of ITransferClientFactory for testing
 */
class MockTransferClientFactory : public ITransferClientFactory {
public:
  MOCK_METHOD(
    std::unique_ptr<ITransferClient>, createClient, (const ConnectionConfig& config), (override)
  );
};

/**
 * Shared bookkeeping for FakeTransferClient instances.
 */
struct FakeClientStats {
  std::atomic<int> created{0};
  std::atomic<int> live{0};
  std::atomic<int> peak_live{0};
  std::atomic<int> disposed{0};
  std::atomic<int> uploads{0};

  std::mutex mutex;
  std::vector<std::string> uploaded_paths;
};

/**
 * Thread-safe in-memory client. Uploads succeed unless the remote path is in
 * failing_paths, which always throws a transient FileTransferError.
 */
class FakeTransferClient : public ITransferClient {
public:
  FakeTransferClient(FakeClientStats& stats, std::vector<std::string> failing_paths = {})
      : stats_(stats)
      , failing_paths_(std::move(failing_paths)) {
    stats_.created++;
  }

  ~FakeTransferClient() override {
    dispose();
  }

  bool isConnected() const override { return connected_; }

  void connect(const CancellationToken*) override {
    if (!connected_) {
      connected_ = true;
      const int live = ++stats_.live;
      int peak = stats_.peak_live.load();
      while (live > peak && !stats_.peak_live.compare_exchange_weak(peak, live)) {
      }
    }
  }

  void disconnect() override {
    if (connected_) {
      connected_ = false;
      stats_.live--;
    }
  }

  bool uploadFile(
    const std::string& local_path, const std::string& remote_path, bool, bool,
    const CancellationToken*
  ) override {
    stats_.uploads++;
    if (std::find(failing_paths_.begin(), failing_paths_.end(), remote_path) !=
        failing_paths_.end()) {
      throw FileTransferError(local_path, remote_path);
    }
    std::lock_guard<std::mutex> lock(stats_.mutex);
    stats_.uploaded_paths.push_back(remote_path);
    return true;
  }

  void createDirectory(const std::string&) override {}
  bool directoryExists(const std::string&) override { return true; }
  bool fileExists(const std::string&) override { return false; }
  std::vector<RemoteFileInfo> listDirectory(const std::string&) override { return {}; }
  void deleteFile(const std::string&) override {}
  void deleteDirectory(const std::string&) override {}
  bool testConnection(const CancellationToken*) override { return true; }

  void dispose() override {
    if (!disposed_) {
      disposed_ = true;
      disconnect();
      stats_.disposed++;
    }
  }

private:
  FakeClientStats& stats_;
  std::vector<std::string> failing_paths_;
  bool connected_ = false;
  bool disposed_ = false;
};

/**
 * Factory producing FakeTransferClient instances that share one stats block.
 */
class FakeTransferClientFactory : public ITransferClientFactory {
public:
  explicit FakeTransferClientFactory(std::vector<std::string> failing_paths = {})
      : failing_paths_(std::move(failing_paths)) {}

  std::unique_ptr<ITransferClient> createClient(const ConnectionConfig&) override {
    return std::make_unique<FakeTransferClient>(stats, failing_paths_);
  }

  FakeClientStats stats;

private:
  std::vector<std::string> failing_paths_;
};

}  // namespace test
}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_TRANSFER_MOCKS_HPP
