// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DEPLOYMENT_HISTORY_HPP
#define FERRY_DEPLOYMENT_HISTORY_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "deployment_result.hpp"
#include "deployment_state.hpp"

namespace ferry {
namespace deploy {

/**
 * One recorded deployment.
 */
struct HistoryEntry {
  std::string id;
  Clock::time_point timestamp;
  std::string profile_name;
  std::string server_host;
  bool success = false;
  double duration_seconds = 0.0;
  int files_uploaded = 0;
  uint64_t total_bytes = 0;
  double average_speed = 0.0;  // bytes per second
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  std::string build_configuration;

  static HistoryEntry fromResult(
    const DeploymentResult& result, const std::string& build_configuration = ""
  );
};

class IDeploymentHistory {
public:
  virtual ~IDeploymentHistory() = default;

  virtual void addEntry(const HistoryEntry& entry) = 0;

  /**
   * Up to count entries, newest first.
   */
  virtual std::vector<HistoryEntry> getRecentEntries(int count = 10) = 0;

  /**
   * @throws std::invalid_argument if profile_name is empty
   */
  virtual std::vector<HistoryEntry> getProfileEntries(
    const std::string& profile_name, int count = 10
  ) = 0;

  /**
   * Entries with from <= timestamp <= to.
   */
  virtual std::vector<HistoryEntry> getEntriesByDateRange(
    Clock::time_point from, Clock::time_point to
  ) = 0;

  virtual void clearHistory() = 0;
};

/**
 * History stored as a JSON array in a single file.
 *
 * The newest entry is kept first and the file is capped at kMaxEntries.
 * Writes go through a temp file and a rename. A file that fails to parse is
 * treated as empty and overwritten by the next addEntry().
 */
class JsonDeploymentHistory : public IDeploymentHistory {
public:
  static constexpr size_t kMaxEntries = 1000;

  explicit JsonDeploymentHistory(std::string history_file);

  JsonDeploymentHistory(const JsonDeploymentHistory&) = delete;
  JsonDeploymentHistory& operator=(const JsonDeploymentHistory&) = delete;

  /**
   * @throws std::runtime_error if the file cannot be written
   */
  void addEntry(const HistoryEntry& entry) override;
  std::vector<HistoryEntry> getRecentEntries(int count = 10) override;
  std::vector<HistoryEntry> getProfileEntries(
    const std::string& profile_name, int count = 10
  ) override;
  std::vector<HistoryEntry> getEntriesByDateRange(
    Clock::time_point from, Clock::time_point to
  ) override;
  void clearHistory() override;

  const std::string& path() const { return history_file_; }

private:
  std::vector<HistoryEntry> load() const;
  void save(const std::vector<HistoryEntry>& entries) const;

  std::string history_file_;
  std::mutex mutex_;
};

/**
 * UTC ISO-8601 with milliseconds, e.g. "2026-03-01T12:30:00.250Z".
 */
std::string formatTimestamp(Clock::time_point tp);

/**
 * Inverse of formatTimestamp(). The fraction is optional.
 *
 * @throws std::invalid_argument on malformed input
 */
Clock::time_point parseTimestamp(const std::string& text);

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_DEPLOYMENT_HISTORY_HPP
