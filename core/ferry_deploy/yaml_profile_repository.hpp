// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_YAML_PROFILE_REPOSITORY_HPP
#define FERRY_YAML_PROFILE_REPOSITORY_HPP

#include <string>
#include <vector>

#include "deployment_profile.hpp"

namespace ferry {
namespace deploy {

/**
 * Values a profile file may leave out.
 */
struct ProfileDefaults {
  int concurrency = 4;
  int retry_count = 3;
  int timeout_seconds = 30;
  std::string build_configuration = "Release";
  std::vector<std::string> exclusion_patterns;  // appended to every profile
};

/**
 * Profiles stored as <profiles_dir>/<name>.yaml.
 *
 * Example:
 *   server: web01.example.com
 *   port: 22
 *   username: deploy
 *   private_key_file: ~/.ssh/id_ed25519
 *   remote_path: /var/www/site
 *   project_path: src/Site/Site.csproj
 *   cleanup_mode: obsolete
 *   exclusion_patterns:
 *     - "uploads/**"
 */
class YamlProfileRepository : public IProfileProvider {
public:
  explicit YamlProfileRepository(std::string profiles_dir, ProfileDefaults defaults = {});

  /**
   * A profile with neither password nor private key takes its password from
   * the FERRY_PASSWORD environment variable.
   *
   * @throws std::invalid_argument for names that are blank or contain path
   *         separators
   */
  DeploymentProfile loadProfile(const std::string& name) override;

  /**
   * Sorted profile names, empty if the directory does not exist.
   */
  std::vector<std::string> listProfiles() const;

  bool profileExists(const std::string& name) const;

  /**
   * @throws ProfileValidationError if the profile is invalid
   * @throws ProfileAlreadyExistsError if it exists and overwrite is false
   * @throws ProfileStorageError if the file cannot be written
   */
  void saveProfile(const DeploymentProfile& profile, bool overwrite = false);

  /**
   * @throws ProfileNotFoundError if no profile has this name
   */
  void deleteProfile(const std::string& name);

  const std::string& profilesDir() const { return profiles_dir_; }

private:
  std::string profilePath(const std::string& name) const;

  std::string profiles_dir_;
  ProfileDefaults defaults_;
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_YAML_PROFILE_REPOSITORY_HPP
