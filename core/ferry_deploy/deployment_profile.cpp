// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "deployment_profile.hpp"

#include <algorithm>
#include <cctype>

#include "ferry_errors.hpp"

namespace ferry {
namespace deploy {

namespace {

constexpr int kMinConcurrency = 1;
constexpr int kMaxConcurrency = 20;
constexpr int kMinRetries = 0;
constexpr int kMaxRetries = 10;

bool isBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

const char* cleanupModeToString(CleanupMode mode) {
  switch (mode) {
    case CleanupMode::None:
      return "none";
    case CleanupMode::DeleteObsolete:
      return "obsolete";
    case CleanupMode::DeleteAll:
      return "all";
  }
  return "unknown";
}

std::optional<CleanupMode> parseCleanupMode(const std::string& value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lower == "none") {
    return CleanupMode::None;
  }
  if (lower == "obsolete" || lower == "deleteobsolete") {
    return CleanupMode::DeleteObsolete;
  }
  if (lower == "all" || lower == "deleteall") {
    return CleanupMode::DeleteAll;
  }
  return std::nullopt;
}

std::vector<std::string> DeploymentProfile::validate() const {
  std::vector<std::string> errors;

  if (isBlank(name)) {
    errors.push_back("Profile name cannot be empty.");
  }
  if (isBlank(server)) {
    errors.push_back("Server host cannot be empty.");
  }
  if (isBlank(username)) {
    errors.push_back("Username cannot be empty.");
  }
  if (port <= 0 || port > 65535) {
    errors.push_back("Port " + std::to_string(port) + " is invalid. Must be between 1 and 65535.");
  }
  if (timeout_seconds <= 0) {
    errors.push_back(
      "Timeout " + std::to_string(timeout_seconds) + " is invalid. Must be greater than 0."
    );
  }
  if (concurrency < kMinConcurrency || concurrency > kMaxConcurrency) {
    errors.push_back(
      "Concurrency " + std::to_string(concurrency) + " is invalid. Must be between 1 and 20."
    );
  }
  if (retry_count < kMinRetries || retry_count > kMaxRetries) {
    errors.push_back(
      "Retry count " + std::to_string(retry_count) + " is invalid. Must be between 0 and 10."
    );
  }
  return errors;
}

std::vector<std::string> DeploymentProfile::portWarnings() const {
  std::vector<std::string> warnings;
  if (protocol == transfer::TransferProtocol::Ftp && port == 22) {
    warnings.push_back(
      "Port 22 is typically used for SFTP, but protocol is set to FTP. Did you mean to use SFTP?"
    );
  } else if (protocol == transfer::TransferProtocol::Sftp && port == 21) {
    warnings.push_back(
      "Port 21 is typically used for FTP, but protocol is set to SFTP. Did you mean to use FTP?"
    );
  }
  return warnings;
}

void DeploymentProfile::ensureValid() const {
  auto errors = validate();
  if (!errors.empty()) {
    throw ProfileValidationError(name, errors);
  }
}

transfer::ConnectionConfig DeploymentProfile::toConnectionConfig() const {
  transfer::ConnectionConfig config;
  config.protocol = protocol;
  config.host = server;
  config.port = port;
  config.username = username;
  config.password = password;
  config.private_key_file = private_key_file;
  config.known_hosts_file = known_hosts_file;
  config.connection_timeout = std::chrono::seconds(timeout_seconds);
  config.remote_root = remote_path.empty() ? "/" : remote_path;
  return config;
}

}  // namespace deploy
}  // namespace ferry
