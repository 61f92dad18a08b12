// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <vector>

#include "ferry_log_macros.hpp"

namespace ferry {
namespace logging {

namespace {

std::mutex g_sinks_mutex;
std::vector<boost::shared_ptr<boost::log::sinks::sink>> g_sinks;
boost::shared_ptr<async_console_sink_t> g_console_sink;
boost::shared_ptr<async_file_sink_t> g_file_sink;
bool g_initialized = false;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

bool parse_bool(const std::string& s, bool default_value) {
  const std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return default_value;
}

void apply_level_env(const char* name, severity_level& target) {
  if (auto level_str = get_env(name)) {
    if (auto level = parse_severity_level(*level_str)) {
      target = *level;
    }
  }
}

void apply_bool_env(const char* name, bool& target) {
  if (auto value = get_env(name)) {
    target = parse_bool(*value, target);
  }
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string lower = to_lower(level_str);
  if (lower == "debug") return severity_level::debug;
  if (lower == "info") return severity_level::info;
  if (lower == "warn" || lower == "warning") return severity_level::warn;
  if (lower == "error") return severity_level::error;
  if (lower == "fatal") return severity_level::fatal;
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto level_str = get_env("FERRY_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*level_str)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }

  apply_level_env("FERRY_LOG_CONSOLE_LEVEL", config.console_level);
  apply_level_env("FERRY_LOG_FILE_LEVEL", config.file_level);
  apply_bool_env("FERRY_LOG_CONSOLE_ENABLED", config.console_enabled);
  apply_bool_env("FERRY_LOG_FILE_ENABLED", config.file_enabled);

  if (auto dir = get_env("FERRY_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = get_env("FERRY_LOG_FORMAT")) {
    config.file_config.format_json = (to_lower(*format) == "json");
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if (g_initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    g_console_sink = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(g_console_sink);
    g_sinks.push_back(g_console_sink);
  }

  if (config.file_enabled) {
    g_file_sink = create_file_sink(config.file_config, config.file_level);
    core->add_sink(g_file_sink);
    g_sinks.push_back(g_file_sink);
  }

  g_initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if (!g_initialized) {
    return;
  }

  auto core = boost::log::core::get();

  // Detach first so no new records reach the queues being drained.
  for (auto& sink : g_sinks) {
    core->remove_sink(sink);
  }
  if (g_console_sink) {
    g_console_sink->stop();
    g_console_sink->flush();
  }
  if (g_file_sink) {
    g_file_sink->stop();
    g_file_sink->flush();
  }

  g_sinks.clear();
  g_console_sink.reset();
  g_file_sink.reset();
  g_initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  boost::log::core::get()->add_sink(sink);
  g_sinks.push_back(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  boost::log::core::get()->remove_sink(sink);
  auto it = std::find(g_sinks.begin(), g_sinks.end(), sink);
  if (it != g_sinks.end()) {
    g_sinks.erase(it);
  }
}

void flush_logging() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if (g_console_sink) {
    g_console_sink->flush();
  }
  if (g_file_sink) {
    g_file_sink->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig final_config = config;
  apply_env_overrides(final_config);
  shutdown_logging();
  init_logging(final_config);
}

bool is_logging_initialized() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  return g_initialized;
}

}  // namespace logging
}  // namespace ferry
