// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CLI_FERRY_CONFIG_HPP
#define FERRY_CLI_FERRY_CONFIG_HPP

#include <cstddef>
#include <string>

#include "yaml_profile_repository.hpp"

namespace ferry {
namespace cli {

/**
 * Logging section of ferry.yaml, kept as strings until
 * convert_logging_config() maps it onto the logging library.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/ferry";
  std::string file_pattern = "ferry_%Y%m%d_%H%M%S.log";
  std::string file_format = "text";  // "text" or "json"
  size_t rotation_size_mb = 50;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

struct PathsConfig {
  std::string profiles_dir;
  std::string history_file;
};

struct FerryConfig {
  deploy::ProfileDefaults defaults;
  PathsConfig paths;
  LoggingConfig logging;
};

/**
 * Base directory for ferry state: $HOME/.ferry, or /tmp/ferry without HOME.
 */
std::string default_ferry_dir();

/**
 * Config with the built-in defaults and paths under default_ferry_dir().
 */
FerryConfig default_config();

}  // namespace cli
}  // namespace ferry

#endif  // FERRY_CLI_FERRY_CONFIG_HPP
