// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <cstdlib>
#include <fstream>

#include <ferry_log_init.hpp>

#include "exclusion_pattern_matcher.hpp"

namespace ferry {
namespace cli {

std::string default_ferry_dir() {
  const char* home = std::getenv("HOME");
  if (home && home[0] != '\0') {
    return std::string(home) + "/.ferry";
  }
  return "/tmp/ferry";
}

FerryConfig default_config() {
  FerryConfig config;
  const std::string base = default_ferry_dir();
  config.paths.profiles_dir = base + "/profiles";
  config.paths.history_file = base + "/history.json";
  return config;
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, FerryConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, FerryConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Config root must be a YAML mapping";
      return false;
    }

    if (node["defaults"]) {
      parse_defaults(node["defaults"], config.defaults);
    }
    if (node["paths"]) {
      parse_paths(node["paths"], config.paths);
    }
    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

void ConfigParser::parse_defaults(const YAML::Node& node, deploy::ProfileDefaults& defaults) {
  if (node["concurrency"]) {
    defaults.concurrency = node["concurrency"].as<int>();
  }
  if (node["retry_count"]) {
    defaults.retry_count = node["retry_count"].as<int>();
  }
  if (node["timeout_seconds"]) {
    defaults.timeout_seconds = node["timeout_seconds"].as<int>();
  }
  if (node["build_configuration"]) {
    defaults.build_configuration = node["build_configuration"].as<std::string>();
  }
  if (node["exclusion_patterns"]) {
    defaults.exclusion_patterns = node["exclusion_patterns"].as<std::vector<std::string>>();
  }
}

void ConfigParser::parse_paths(const YAML::Node& node, PathsConfig& paths) {
  if (node["profiles_dir"]) {
    paths.profiles_dir = node["profiles_dir"].as<std::string>();
  }
  if (node["history_file"]) {
    paths.history_file = node["history_file"].as<std::string>();
  }
}

void ConfigParser::parse_logging(const YAML::Node& node, LoggingConfig& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
}

bool ConfigParser::validate(const FerryConfig& config, std::string& error_msg) {
  const auto& defaults = config.defaults;
  if (defaults.concurrency < 1 || defaults.concurrency > 20) {
    error_msg = "Invalid defaults.concurrency - must be between 1 and 20";
    return false;
  }
  if (defaults.retry_count < 0 || defaults.retry_count > 10) {
    error_msg = "Invalid defaults.retry_count - must be between 0 and 10";
    return false;
  }
  if (defaults.timeout_seconds <= 0) {
    error_msg = "Invalid defaults.timeout_seconds - must be > 0";
    return false;
  }
  if (defaults.build_configuration.empty()) {
    error_msg = "defaults.build_configuration is empty";
    return false;
  }
  for (const auto& pattern : defaults.exclusion_patterns) {
    if (!deploy::ExclusionPatternMatcher::isValidPattern(pattern)) {
      error_msg = "Invalid exclusion pattern: '" + pattern + "'";
      return false;
    }
  }

  if (config.paths.profiles_dir.empty()) {
    error_msg = "paths.profiles_dir is empty";
    return false;
  }
  if (config.paths.history_file.empty()) {
    error_msg = "paths.history_file is empty";
    return false;
  }

  const auto& logging = config.logging;
  if (!::ferry::logging::parse_severity_level(logging.console_level)) {
    error_msg = "Invalid logging.console.level: '" + logging.console_level + "'";
    return false;
  }
  if (!::ferry::logging::parse_severity_level(logging.file_level)) {
    error_msg = "Invalid logging.file.level: '" + logging.file_level + "'";
    return false;
  }
  if (logging.file_format != "text" && logging.file_format != "json") {
    error_msg = "logging.file.format must be 'text' or 'json'";
    return false;
  }
  if (logging.file_enabled && logging.file_directory.empty()) {
    error_msg = "File logging enabled but logging.file.directory is empty";
    return false;
  }

  return true;
}

void convert_logging_config(
  const LoggingConfig& yaml_config, ::ferry::logging::LoggingConfig& log_config
) {
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;
  if (auto level = ::ferry::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  log_config.file_enabled = yaml_config.file_enabled;
  if (auto level = ::ferry::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

}  // namespace cli
}  // namespace ferry
