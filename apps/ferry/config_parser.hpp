// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CLI_CONFIG_PARSER_HPP
#define FERRY_CLI_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "ferry_config.hpp"

namespace ferry {
namespace logging {
struct LoggingConfig;
}
}  // namespace ferry

namespace ferry {
namespace cli {

/**
 * Convert the ferry.yaml logging section to ferry::logging::LoggingConfig.
 * Unknown level names leave the library default in place.
 */
void convert_logging_config(
  const LoggingConfig& yaml_config, ::ferry::logging::LoggingConfig& log_config
);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file. Keys absent from the file keep the
   * values already in config.
   */
  bool load_from_file(const std::string& path, FerryConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, FerryConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const FerryConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  void parse_defaults(const YAML::Node& node, deploy::ProfileDefaults& defaults);
  void parse_paths(const YAML::Node& node, PathsConfig& paths);
  void parse_logging(const YAML::Node& node, LoggingConfig& logging);

  mutable std::string last_error_;
};

}  // namespace cli
}  // namespace ferry

#endif  // FERRY_CLI_CONFIG_PARSER_HPP
