// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_TRANSFER_TYPES_HPP
#define FERRY_TRANSFER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <string>

namespace ferry {
namespace transfer {

using Clock = std::chrono::system_clock;

/**
 * One file to upload.
 */
struct TransferTask {
  std::string local_path;
  std::string remote_path;
  uint64_t size = 0;
  bool overwrite = true;
  bool create_directories = true;
  int priority = 0;  // lower runs sooner
  std::map<std::string, std::string> metadata;
};

enum class TransferStatus { Succeeded, Failed, Cancelled };

const char* transferStatusToString(TransferStatus status);

/**
 * Outcome of one TransferTask, created once after its last attempt.
 */
struct TransferResult {
  TransferTask task;
  bool success = false;
  TransferStatus status = TransferStatus::Failed;
  std::string error_message;
  std::exception_ptr error;
  int retry_attempts = 0;
  Clock::time_point started_at;
  Clock::time_point finished_at;

  std::chrono::milliseconds duration() const;

  /**
   * task.size over duration(), 0 when the duration is zero.
   */
  double bytesPerSecond() const;

  /**
   * @param success Value returned by the client. A client may decline an
   *        upload (for example overwrite=false on an existing file) without
   *        raising, which yields success=false with status Failed.
   */
  static TransferResult fromSuccess(
    const TransferTask& task, bool success, Clock::time_point started_at,
    Clock::time_point finished_at, int retry_attempts = 0
  );

  static TransferResult fromFailure(
    const TransferTask& task, std::exception_ptr error, Clock::time_point started_at,
    Clock::time_point finished_at, int retry_attempts
  );

  static TransferResult fromCancellation(
    const TransferTask& task, Clock::time_point started_at, Clock::time_point finished_at,
    int retry_attempts
  );
};

/**
 * Aggregate progress of one uploadAll() call.
 */
struct TransferProgress {
  int total_files = 0;
  int completed_files = 0;
  int active_uploads = 0;
  int pending_files = 0;
  int successful_files = 0;
  int failed_files = 0;
  uint64_t total_bytes = 0;
  uint64_t uploaded_bytes = 0;
  double current_speed = 0.0;  // bytes per second
  double average_speed = 0.0;  // bytes per second
  std::optional<std::chrono::seconds> estimated_time_remaining;
  Clock::time_point started_at;

  /**
   * Completed over total files as a percentage with two decimals.
   */
  double progressPercentage() const;

  double byteProgressPercentage() const;

  bool isComplete() const { return completed_files >= total_files; }

  /**
   * "0 B/s", "512.00 B/s", "1.50 KB/s", "2.00 MB/s" or "1.00 GB/s".
   */
  static std::string formatSpeed(double bytes_per_second);
};

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_TRANSFER_TYPES_HPP
