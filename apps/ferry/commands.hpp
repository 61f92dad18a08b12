// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CLI_COMMANDS_HPP
#define FERRY_CLI_COMMANDS_HPP

#include <atomic>
#include <string>
#include <vector>

#include "deployment_options.hpp"
#include "ferry_config.hpp"

namespace ferry {
namespace cli {

/**
 * Command handler for the ferry CLI
 */
class Commands {
public:
  explicit Commands(FerryConfig config = default_config());
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Cancel a running deployment once flag becomes true. main() points this
   * at the flag its SIGINT/SIGTERM handler sets.
   */
  void set_cancel_flag(const std::atomic<bool>* flag) {
    cancel_flag_ = flag;
  }

  /**
   * Execute deploy command
   */
  int deploy(const deploy::DeploymentOptions& options);

  /**
   * Execute history command. An empty profile lists every profile.
   */
  int history(const std::string& profile, int limit);

  /**
   * Execute validate command
   */
  int validate(const std::string& profile);

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

  /**
   * Parse the arguments following "deploy".
   *
   * @throws std::invalid_argument on unknown flags or bad values
   */
  static deploy::DeploymentOptions parse_deploy_options(const std::vector<std::string>& args);

  const FerryConfig& config() const {
    return config_;
  }

private:
  /**
   * Load ferry.yaml into config_. An explicit path must exist; the default
   * $HOME/.ferry/ferry.yaml is optional.
   */
  bool load_config(const std::string& path, bool required);

  void configure_logging();

  /**
   * Print usage message
   */
  void print_usage();

  FerryConfig config_;
  const std::atomic<bool>* cancel_flag_ = nullptr;
};

}  // namespace cli
}  // namespace ferry

#endif  // FERRY_CLI_COMMANDS_HPP
