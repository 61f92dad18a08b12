// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DEPLOYMENT_PROFILE_HPP
#define FERRY_DEPLOYMENT_PROFILE_HPP

#include <optional>
#include <string>
#include <vector>

#include "transfer_client.hpp"

namespace ferry {
namespace deploy {

enum class CleanupMode { None, DeleteObsolete, DeleteAll };

const char* cleanupModeToString(CleanupMode mode);

/**
 * Parse "none", "obsolete"/"deleteobsolete" or "all"/"deleteall", ignoring
 * case.
 */
std::optional<CleanupMode> parseCleanupMode(const std::string& value);

/**
 * Named deployment target: server, credentials, remote root and the build
 * and upload settings used for it.
 */
struct DeploymentProfile {
  std::string name;
  std::string server;
  int port = 22;
  transfer::TransferProtocol protocol = transfer::TransferProtocol::Sftp;
  std::string username;
  std::string password;
  std::string private_key_file;
  std::string known_hosts_file;
  std::string remote_path = "/";
  std::string project_path;

  int concurrency = 4;
  int timeout_seconds = 30;
  int retry_count = 3;
  std::string build_configuration = "Release";
  std::vector<std::string> exclusion_patterns;
  CleanupMode cleanup_mode = CleanupMode::None;
  bool app_offline_enabled = true;
  std::string target_framework;
  std::string runtime_identifier;

  /**
   * Blocking configuration problems. Empty when the profile is usable.
   */
  std::vector<std::string> validate() const;

  /**
   * Non-blocking hints such as an FTP profile pointed at port 22.
   */
  std::vector<std::string> portWarnings() const;

  /**
   * @throws ProfileValidationError if validate() reports anything
   */
  void ensureValid() const;

  transfer::ConnectionConfig toConnectionConfig() const;
};

/**
 * Source of deployment profiles for the orchestrator.
 */
class IProfileProvider {
public:
  virtual ~IProfileProvider() = default;

  /**
   * @throws ProfileNotFoundError if no profile has this name
   * @throws ProfileStorageError if the stored profile cannot be read
   */
  virtual DeploymentProfile loadProfile(const std::string& name) = 0;
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_DEPLOYMENT_PROFILE_HPP
