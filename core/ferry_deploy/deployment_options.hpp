// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DEPLOYMENT_OPTIONS_HPP
#define FERRY_DEPLOYMENT_OPTIONS_HPP

#include <optional>
#include <string>

#include "deployment_profile.hpp"

namespace ferry {
namespace deploy {

/**
 * Per-run overrides on top of the stored profile.
 */
struct DeploymentOptions {
  std::string profile_name;
  std::string project_path;  // empty: the profile's project_path
  std::string target_host;   // empty: the profile's server

  bool use_app_offline = true;              // also requires profile.app_offline_enabled
  std::optional<CleanupMode> cleanup_mode;  // unset: the profile's cleanup_mode

  bool skip_confirmation = false;
  bool skip_connection_test = false;
  bool dry_run = false;

  std::string build_configuration;  // empty: the profile's value
  int max_concurrency = 0;          // 0: the profile's value

  // Publish directory. A temporary one is created and removed when empty.
  std::string output_dir;
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_DEPLOYMENT_OPTIONS_HPP
