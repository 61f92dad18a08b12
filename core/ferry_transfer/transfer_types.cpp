// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_types.hpp"

#include <cmath>
#include <cstdio>

#include "retry_handler.hpp"

namespace ferry {
namespace transfer {

const char* transferStatusToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::Succeeded:
      return "Succeeded";
    case TransferStatus::Failed:
      return "Failed";
    case TransferStatus::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

// ============================================================================
// TransferResult
// ============================================================================

std::chrono::milliseconds TransferResult::duration() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at);
}

double TransferResult::bytesPerSecond() const {
  const auto ms = duration().count();
  if (ms <= 0) {
    return 0.0;
  }
  return static_cast<double>(task.size) / (static_cast<double>(ms) / 1000.0);
}

TransferResult TransferResult::fromSuccess(
  const TransferTask& task, bool success, Clock::time_point started_at,
  Clock::time_point finished_at, int retry_attempts
) {
  TransferResult result;
  result.task = task;
  result.success = success;
  result.status = success ? TransferStatus::Succeeded : TransferStatus::Failed;
  if (!success) {
    result.error_message = "Upload of '" + task.local_path + "' was declined by the server.";
  }
  result.retry_attempts = retry_attempts;
  result.started_at = started_at;
  result.finished_at = finished_at;
  return result;
}

TransferResult TransferResult::fromFailure(
  const TransferTask& task, std::exception_ptr error, Clock::time_point started_at,
  Clock::time_point finished_at, int retry_attempts
) {
  TransferResult result;
  result.task = task;
  result.success = false;
  result.status = TransferStatus::Failed;
  result.error_message = describeException(error);
  result.error = std::move(error);
  result.retry_attempts = retry_attempts;
  result.started_at = started_at;
  result.finished_at = finished_at;
  return result;
}

TransferResult TransferResult::fromCancellation(
  const TransferTask& task, Clock::time_point started_at, Clock::time_point finished_at,
  int retry_attempts
) {
  TransferResult result;
  result.task = task;
  result.success = false;
  result.status = TransferStatus::Cancelled;
  result.error_message = "Upload was cancelled.";
  result.retry_attempts = retry_attempts;
  result.started_at = started_at;
  result.finished_at = finished_at;
  return result;
}

// ============================================================================
// TransferProgress
// ============================================================================

double TransferProgress::progressPercentage() const {
  if (total_files <= 0) {
    return 0.0;
  }
  const double percent = static_cast<double>(completed_files) * 100.0 / total_files;
  return std::round(percent * 100.0) / 100.0;
}

double TransferProgress::byteProgressPercentage() const {
  if (total_bytes == 0) {
    return 0.0;
  }
  const double percent =
    static_cast<double>(uploaded_bytes) * 100.0 / static_cast<double>(total_bytes);
  return std::round(percent * 100.0) / 100.0;
}

std::string TransferProgress::formatSpeed(double bytes_per_second) {
  if (bytes_per_second <= 0.0) {
    return "0 B/s";
  }

  static const char* units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
  size_t unit = 0;
  double value = bytes_per_second;
  while (value >= 1024.0 && unit < 3) {
    value /= 1024.0;
    ++unit;
  }

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
  return buf;
}

}  // namespace transfer
}  // namespace ferry
