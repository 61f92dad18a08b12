// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "yaml_profile_repository.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "ferry_errors.hpp"

#define FERRY_LOG_COMPONENT "profiles"
#include <ferry_log_macros.hpp>

using ::ferry::logging::kv;

namespace fs = std::filesystem;

namespace ferry {
namespace deploy {

namespace {

constexpr const char* kProfileExtension = ".yaml";

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

transfer::TransferProtocol parseProtocol(const std::string& value, const std::string& profile) {
  const std::string v = lower(value);
  if (v == "sftp") {
    return transfer::TransferProtocol::Sftp;
  }
  if (v == "ftp") {
    return transfer::TransferProtocol::Ftp;
  }
  throw ProfileStorageError("Unknown protocol '" + value + "'", profile);
}

void parseProfile(const YAML::Node& node, DeploymentProfile& profile) {
  if (node["name"]) {
    profile.name = node["name"].as<std::string>();
  }
  if (node["server"]) {
    profile.server = node["server"].as<std::string>();
  }
  if (node["port"]) {
    profile.port = node["port"].as<int>();
  }
  if (node["protocol"]) {
    profile.protocol = parseProtocol(node["protocol"].as<std::string>(), profile.name);
  }
  if (node["username"]) {
    profile.username = node["username"].as<std::string>();
  }
  if (node["password"]) {
    profile.password = node["password"].as<std::string>();
  }
  if (node["private_key_file"]) {
    profile.private_key_file = node["private_key_file"].as<std::string>();
  }
  if (node["known_hosts_file"]) {
    profile.known_hosts_file = node["known_hosts_file"].as<std::string>();
  }
  if (node["remote_path"]) {
    profile.remote_path = node["remote_path"].as<std::string>();
  }
  if (node["project_path"]) {
    profile.project_path = node["project_path"].as<std::string>();
  }
  if (node["concurrency"]) {
    profile.concurrency = node["concurrency"].as<int>();
  }
  if (node["timeout_seconds"]) {
    profile.timeout_seconds = node["timeout_seconds"].as<int>();
  }
  if (node["retry_count"]) {
    profile.retry_count = node["retry_count"].as<int>();
  }
  if (node["build_configuration"]) {
    profile.build_configuration = node["build_configuration"].as<std::string>();
  }
  if (node["exclusion_patterns"]) {
    profile.exclusion_patterns = node["exclusion_patterns"].as<std::vector<std::string>>();
  }
  if (node["cleanup_mode"]) {
    const auto value = node["cleanup_mode"].as<std::string>();
    auto mode = parseCleanupMode(value);
    if (!mode) {
      throw ProfileStorageError("Unknown cleanup mode '" + value + "'", profile.name);
    }
    profile.cleanup_mode = *mode;
  }
  if (node["app_offline"]) {
    profile.app_offline_enabled = node["app_offline"].as<bool>();
  }
  if (node["target_framework"]) {
    profile.target_framework = node["target_framework"].as<std::string>();
  }
  if (node["runtime_identifier"]) {
    profile.runtime_identifier = node["runtime_identifier"].as<std::string>();
  }
}

void emitIfSet(YAML::Emitter& out, const char* key, const std::string& value) {
  if (!value.empty()) {
    out << YAML::Key << key << YAML::Value << value;
  }
}

}  // namespace

YamlProfileRepository::YamlProfileRepository(std::string profiles_dir, ProfileDefaults defaults)
    : profiles_dir_(std::move(profiles_dir))
    , defaults_(std::move(defaults)) {}

std::string YamlProfileRepository::profilePath(const std::string& name) const {
  const bool blank = std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  if (blank || name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
      name == "." || name == "..") {
    throw std::invalid_argument("Invalid profile name: '" + name + "'");
  }
  return (fs::path(profiles_dir_) / (name + kProfileExtension)).string();
}

DeploymentProfile YamlProfileRepository::loadProfile(const std::string& name) {
  const std::string path = profilePath(name);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw ProfileNotFoundError(name);
  }

  DeploymentProfile profile;
  profile.name = name;
  profile.concurrency = defaults_.concurrency;
  profile.retry_count = defaults_.retry_count;
  profile.timeout_seconds = defaults_.timeout_seconds;
  profile.build_configuration = defaults_.build_configuration;

  try {
    YAML::Node node = YAML::LoadFile(path);
    if (node.IsMap()) {
      parseProfile(node, profile);
    } else if (!node.IsNull()) {
      throw ProfileStorageError("Profile file must contain a YAML mapping: " + path, name);
    }
  } catch (const YAML::Exception& e) {
    throw ProfileStorageError("Failed to parse profile " + path + ": " + e.what(), name);
  }

  if (profile.password.empty() && profile.private_key_file.empty()) {
    const char* env_password = std::getenv("FERRY_PASSWORD");
    if (env_password != nullptr && env_password[0] != '\0') {
      profile.password = env_password;
    }
  }

  for (const auto& pattern : defaults_.exclusion_patterns) {
    if (std::find(profile.exclusion_patterns.begin(), profile.exclusion_patterns.end(), pattern) ==
        profile.exclusion_patterns.end()) {
      profile.exclusion_patterns.push_back(pattern);
    }
  }

  FERRY_LOG_DEBUG("Loaded profile" << kv("name", profile.name) << kv("path", path));
  return profile;
}

std::vector<std::string> YamlProfileRepository::listProfiles() const {
  std::vector<std::string> names;
  std::error_code ec;
  if (!fs::is_directory(profiles_dir_, ec)) {
    return names;
  }

  for (fs::directory_iterator it(profiles_dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == kProfileExtension) {
      names.push_back(it->path().stem().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

bool YamlProfileRepository::profileExists(const std::string& name) const {
  std::error_code ec;
  return fs::is_regular_file(profilePath(name), ec);
}

void YamlProfileRepository::saveProfile(const DeploymentProfile& profile, bool overwrite) {
  profile.ensureValid();

  const std::string path = profilePath(profile.name);
  if (!overwrite && profileExists(profile.name)) {
    throw ProfileAlreadyExistsError(profile.name);
  }

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << profile.name;
  out << YAML::Key << "server" << YAML::Value << profile.server;
  out << YAML::Key << "port" << YAML::Value << profile.port;
  out << YAML::Key << "protocol" << YAML::Value << lower(transfer::protocolToString(profile.protocol));
  out << YAML::Key << "username" << YAML::Value << profile.username;
  emitIfSet(out, "password", profile.password);
  emitIfSet(out, "private_key_file", profile.private_key_file);
  emitIfSet(out, "known_hosts_file", profile.known_hosts_file);
  out << YAML::Key << "remote_path" << YAML::Value << profile.remote_path;
  emitIfSet(out, "project_path", profile.project_path);
  out << YAML::Key << "concurrency" << YAML::Value << profile.concurrency;
  out << YAML::Key << "timeout_seconds" << YAML::Value << profile.timeout_seconds;
  out << YAML::Key << "retry_count" << YAML::Value << profile.retry_count;
  out << YAML::Key << "build_configuration" << YAML::Value << profile.build_configuration;
  if (!profile.exclusion_patterns.empty()) {
    out << YAML::Key << "exclusion_patterns" << YAML::Value << YAML::BeginSeq;
    for (const auto& pattern : profile.exclusion_patterns) {
      out << pattern;
    }
    out << YAML::EndSeq;
  }
  out << YAML::Key << "cleanup_mode" << YAML::Value << cleanupModeToString(profile.cleanup_mode);
  out << YAML::Key << "app_offline" << YAML::Value << profile.app_offline_enabled;
  emitIfSet(out, "target_framework", profile.target_framework);
  emitIfSet(out, "runtime_identifier", profile.runtime_identifier);
  out << YAML::EndMap;

  if (!out.good()) {
    throw ProfileStorageError("Failed to serialize profile: " + out.GetLastError(), profile.name);
  }

  std::error_code ec;
  fs::create_directories(profiles_dir_, ec);
  if (ec) {
    throw ProfileStorageError(
      "Failed to create profiles directory " + profiles_dir_ + ": " + ec.message(), profile.name
    );
  }

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      throw ProfileStorageError("Failed to open " + tmp_path + " for writing", profile.name);
    }
    file << out.c_str() << "\n";
    file.close();
    if (!file) {
      fs::remove(tmp_path, ec);
      throw ProfileStorageError("Failed to write " + tmp_path, profile.name);
    }
  }
  fs::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    throw ProfileStorageError("Failed to replace " + path + ": " + ec.message(), profile.name);
  }

  FERRY_LOG_INFO("Profile saved" << kv("name", profile.name) << kv("path", path));
}

void YamlProfileRepository::deleteProfile(const std::string& name) {
  const std::string path = profilePath(name);
  std::error_code ec;
  if (!fs::remove(path, ec)) {
    if (ec) {
      throw ProfileStorageError("Failed to delete " + path + ": " + ec.message(), name);
    }
    throw ProfileNotFoundError(name);
  }
  FERRY_LOG_INFO("Profile deleted" << kv("name", name));
}

}  // namespace deploy
}  // namespace ferry
