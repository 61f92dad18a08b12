// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "deployment_history.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#define FERRY_LOG_COMPONENT "history"
#include <ferry_log_macros.hpp>

using ::ferry::logging::kv;

namespace ferry {
namespace deploy {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

nlohmann::json toJson(const HistoryEntry& entry) {
  nlohmann::json j;
  j["id"] = entry.id;
  j["timestamp"] = formatTimestamp(entry.timestamp);
  j["profileName"] = entry.profile_name;
  j["serverHost"] = entry.server_host;
  j["success"] = entry.success;
  j["durationSeconds"] = entry.duration_seconds;
  j["filesUploaded"] = entry.files_uploaded;
  j["totalBytes"] = entry.total_bytes;
  j["averageSpeed"] = entry.average_speed;
  j["errors"] = entry.errors;
  j["warnings"] = entry.warnings;
  j["buildConfiguration"] = entry.build_configuration;
  return j;
}

HistoryEntry fromJson(const nlohmann::json& j) {
  HistoryEntry entry;
  entry.id = j.value("id", std::string());
  entry.timestamp = parseTimestamp(j.at("timestamp").get<std::string>());
  entry.profile_name = j.value("profileName", std::string());
  entry.server_host = j.value("serverHost", std::string());
  entry.success = j.value("success", false);
  entry.duration_seconds = j.value("durationSeconds", 0.0);
  entry.files_uploaded = j.value("filesUploaded", 0);
  entry.total_bytes = j.value("totalBytes", static_cast<uint64_t>(0));
  entry.average_speed = j.value("averageSpeed", 0.0);
  entry.errors = j.value("errors", std::vector<std::string>());
  entry.warnings = j.value("warnings", std::vector<std::string>());
  entry.build_configuration = j.value("buildConfiguration", std::string());
  return entry;
}

void sortNewestFirst(std::vector<HistoryEntry>& entries) {
  std::stable_sort(entries.begin(), entries.end(), [](const HistoryEntry& a, const HistoryEntry& b) {
    return a.timestamp > b.timestamp;
  });
}

void truncate(std::vector<HistoryEntry>& entries, int count) {
  const size_t limit = count < 0 ? 0 : static_cast<size_t>(count);
  if (entries.size() > limit) {
    entries.resize(limit);
  }
}

}  // namespace

std::string formatTimestamp(Clock::time_point tp) {
  const auto time_t_value = Clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
  if (ms.count() < 0) {
    ms += std::chrono::milliseconds(1000);
  }

  std::tm tm_buf;
  gmtime_r(&time_t_value, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
  oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
  return oss.str();
}

Clock::time_point parseTimestamp(const std::string& text) {
  std::tm tm_buf{};
  int millis = 0;
  char tail[8] = {0};

  const int fields = std::sscanf(
    text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d%7s", &tm_buf.tm_year, &tm_buf.tm_mon,
    &tm_buf.tm_mday, &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &millis, tail
  );
  if (fields < 6) {
    throw std::invalid_argument("Invalid timestamp: " + text);
  }
  if (fields < 7) {
    millis = 0;
  }

  tm_buf.tm_year -= 1900;
  tm_buf.tm_mon -= 1;
  const time_t seconds = timegm(&tm_buf);
  if (seconds == static_cast<time_t>(-1)) {
    throw std::invalid_argument("Invalid timestamp: " + text);
  }
  return Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

HistoryEntry HistoryEntry::fromResult(
  const DeploymentResult& result, const std::string& build_configuration
) {
  HistoryEntry entry;
  entry.id = result.deployment_id;
  entry.timestamp = result.started_at;
  entry.profile_name = result.profile_name;
  entry.server_host = result.target_host;
  entry.success = result.success;
  entry.duration_seconds = static_cast<double>(result.duration().count()) / 1000.0;
  entry.files_uploaded = result.files_uploaded;
  entry.total_bytes = result.size_uploaded;
  entry.average_speed = result.averageSpeed().value_or(0.0);
  entry.errors = result.errors;
  entry.warnings = result.warnings;
  entry.build_configuration = build_configuration;
  return entry;
}

JsonDeploymentHistory::JsonDeploymentHistory(std::string history_file)
    : history_file_(std::move(history_file)) {
  if (history_file_.empty()) {
    throw std::invalid_argument("History file path cannot be empty.");
  }
}

void JsonDeploymentHistory::addEntry(const HistoryEntry& entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load();
  entries.insert(entries.begin(), entry);
  if (entries.size() > kMaxEntries) {
    entries.resize(kMaxEntries);
  }
  save(entries);
  FERRY_LOG_DEBUG("History entry recorded" << kv("id", entry.id) << kv("entries", entries.size()));
}

std::vector<HistoryEntry> JsonDeploymentHistory::getRecentEntries(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load();
  sortNewestFirst(entries);
  truncate(entries, count);
  return entries;
}

std::vector<HistoryEntry> JsonDeploymentHistory::getProfileEntries(
  const std::string& profile_name, int count
) {
  if (profile_name.empty()) {
    throw std::invalid_argument("Profile name cannot be empty.");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load();
  entries.erase(
    std::remove_if(
      entries.begin(), entries.end(),
      [&](const HistoryEntry& e) {
        return !equalsIgnoreCase(e.profile_name, profile_name);
      }
    ),
    entries.end()
  );
  sortNewestFirst(entries);
  truncate(entries, count);
  return entries;
}

std::vector<HistoryEntry> JsonDeploymentHistory::getEntriesByDateRange(
  Clock::time_point from, Clock::time_point to
) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load();
  entries.erase(
    std::remove_if(
      entries.begin(), entries.end(),
      [&](const HistoryEntry& e) {
        return e.timestamp < from || e.timestamp > to;
      }
    ),
    entries.end()
  );
  return entries;
}

void JsonDeploymentHistory::clearHistory() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::remove(history_file_, ec);
  if (ec) {
    throw std::runtime_error("Failed to delete history file " + history_file_ + ": " + ec.message());
  }
}

std::vector<HistoryEntry> JsonDeploymentHistory::load() const {
  std::ifstream in(history_file_);
  if (!in) {
    return {};
  }

  try {
    const auto doc = nlohmann::json::parse(in);
    std::vector<HistoryEntry> entries;
    if (!doc.is_array()) {
      FERRY_LOG_WARN("History file is not a JSON array, ignoring" << kv("path", history_file_));
      return entries;
    }
    entries.reserve(doc.size());
    for (const auto& item : doc) {
      entries.push_back(fromJson(item));
    }
    return entries;
  } catch (const nlohmann::json::exception& e) {
    FERRY_LOG_WARN(
      "History file is corrupted, ignoring" << kv("path", history_file_) << kv("error", e.what())
    );
  } catch (const std::invalid_argument& e) {
    FERRY_LOG_WARN(
      "History file is corrupted, ignoring" << kv("path", history_file_) << kv("error", e.what())
    );
  }
  return {};
}

void JsonDeploymentHistory::save(const std::vector<HistoryEntry>& entries) const {
  namespace fs = std::filesystem;

  const fs::path path(history_file_);
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error(
        "Failed to create history directory " + path.parent_path().string() + ": " + ec.message()
      );
    }
  }

  nlohmann::json doc = nlohmann::json::array();
  for (const auto& entry : entries) {
    doc.push_back(toJson(entry));
  }

  // Atomic write: write to temp file, then rename
  fs::path tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Failed to open " + tmp_path.string() + " for writing");
    }
    out << doc.dump(2);
    out.close();
    if (!out) {
      fs::remove(tmp_path, ec);
      throw std::runtime_error("Failed to write " + tmp_path.string());
    }
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    throw std::runtime_error("Failed to replace " + history_file_ + ": " + ec.message());
  }
}

}  // namespace deploy
}  // namespace ferry
