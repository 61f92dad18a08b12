// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_ERRORS_HPP
#define FERRY_ERRORS_HPP

#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace ferry {

/**
 * Root of every error raised by ferry components.
 */
class FerryError : public std::runtime_error {
public:
  explicit FerryError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Invalid settings detected before any work starts. Never retried.
 */
class ConfigurationError : public FerryError {
public:
  explicit ConfigurationError(const std::string& message)
      : FerryError(message) {}
};

/**
 * A bounded wait expired.
 */
class TimeoutError : public FerryError {
public:
  explicit TimeoutError(const std::string& message)
      : FerryError(message) {}
};

// ============================================================================
// Authentication
// ============================================================================

class AuthenticationError : public FerryError {
public:
  AuthenticationError(
    const std::string& message, const std::string& username = "", const std::string& host = "",
    bool is_credential_error = true
  )
      : FerryError(message)
      , username_(username)
      , host_(host)
      , is_credential_error_(is_credential_error) {}

  const std::string& username() const { return username_; }
  const std::string& host() const { return host_; }
  bool isCredentialError() const { return is_credential_error_; }

private:
  std::string username_;
  std::string host_;
  bool is_credential_error_;
};

class InvalidCredentialsError : public AuthenticationError {
public:
  InvalidCredentialsError(const std::string& username, const std::string& host)
      : AuthenticationError(
          "Authentication failed for user '" + username + "' on " + host +
            ". Please check your username and password.",
          username, host, true
        ) {}
};

class InsufficientPermissionsError : public AuthenticationError {
public:
  InsufficientPermissionsError(
    const std::string& username, const std::string& host, const std::string& operation
  )
      : AuthenticationError(
          "User '" + username + "' does not have sufficient permissions to " + operation +
            " on " + host + ".",
          username, host, false
        ) {}
};

// ============================================================================
// Build
// ============================================================================

class BuildError : public FerryError {
public:
  BuildError(
    const std::string& message, const std::string& project_path = "",
    const std::string& configuration = ""
  )
      : FerryError(message)
      , project_path_(project_path)
      , configuration_(configuration) {}

  const std::string& projectPath() const { return project_path_; }
  const std::string& configuration() const { return configuration_; }

private:
  std::string project_path_;
  std::string configuration_;
};

class BuildCompilationError : public BuildError {
public:
  BuildCompilationError(
    const std::vector<std::string>& errors, const std::string& project_path = "",
    const std::string& configuration = ""
  )
      : BuildError(
          "Build compilation failed with " + std::to_string(errors.size()) + " error(s).",
          project_path, configuration
        )
      , errors_(errors) {}

  const std::vector<std::string>& errors() const { return errors_; }

private:
  std::vector<std::string> errors_;
};

class BuildToolNotFoundError : public BuildError {
public:
  explicit BuildToolNotFoundError(const std::string& tool_name)
      : BuildError(
          "Build tool '" + tool_name + "' was not found. Please ensure it is installed and on PATH."
        )
      , tool_name_(tool_name) {}

  const std::string& toolName() const { return tool_name_; }

private:
  std::string tool_name_;
};

// ============================================================================
// Connection
// ============================================================================

class ConnectionError : public FerryError {
public:
  ConnectionError(
    const std::string& message, const std::string& host = "", int port = 0,
    bool is_transient = true
  )
      : FerryError(message)
      , host_(host)
      , port_(port)
      , is_transient_(is_transient) {}

  const std::string& host() const { return host_; }
  int port() const { return port_; }

  /**
   * True when the same call may succeed if repeated later.
   */
  bool isTransient() const { return is_transient_; }

private:
  std::string host_;
  int port_;
  bool is_transient_;
};

class ConnectionTimeoutError : public ConnectionError {
public:
  ConnectionTimeoutError(const std::string& host, int port, double timeout_seconds)
      : ConnectionError(format(host, port, timeout_seconds), host, port, true) {}

private:
  static std::string format(const std::string& host, int port, double timeout_seconds) {
    char seconds[32];
    std::snprintf(seconds, sizeof(seconds), "%.1f", timeout_seconds);
    return "Connection to " + host + ":" + std::to_string(port) + " timed out after " + seconds +
           " seconds.";
  }
};

class ConnectionRefusedError : public ConnectionError {
public:
  ConnectionRefusedError(const std::string& host, int port)
      : ConnectionError(
          "Connection to " + host + ":" + std::to_string(port) +
            " was refused. Please check the server address and port.",
          host, port, false
        ) {}
};

/**
 * The server identity could not be verified.
 */
class SslCertificateError : public ConnectionError {
public:
  SslCertificateError(const std::string& message, const std::string& host, int port)
      : ConnectionError(message, host, port, false) {}
};

// ============================================================================
// Deployment
// ============================================================================

enum class DeploymentPhase {
  Unknown,
  Initialization,
  Build,
  Connection,
  Authentication,
  Upload,
  Verification
};

class DeploymentError : public FerryError {
public:
  DeploymentError(
    const std::string& message, const std::string& profile_name = "",
    DeploymentPhase phase = DeploymentPhase::Unknown, bool is_retryable = false
  )
      : FerryError(message)
      , profile_name_(profile_name)
      , phase_(phase)
      , is_retryable_(is_retryable) {}

  const std::string& profileName() const { return profile_name_; }
  DeploymentPhase phase() const { return phase_; }
  bool isRetryable() const { return is_retryable_; }

private:
  std::string profile_name_;
  DeploymentPhase phase_;
  bool is_retryable_;
};

class FileTransferError : public DeploymentError {
public:
  FileTransferError(const std::string& local_path, const std::string& remote_path)
      : DeploymentError(
          "Failed to transfer file '" + local_path + "' to '" + remote_path + "'.", "",
          DeploymentPhase::Upload, true
        )
      , local_path_(local_path)
      , remote_path_(remote_path) {}

  const std::string& localPath() const { return local_path_; }
  const std::string& remotePath() const { return remote_path_; }

private:
  std::string local_path_;
  std::string remote_path_;
};

class InsufficientDiskSpaceError : public DeploymentError {
public:
  explicit InsufficientDiskSpaceError(const std::string& remote_path)
      : DeploymentError(
          "Insufficient disk space on the server while writing '" + remote_path + "'.", "",
          DeploymentPhase::Upload, false
        ) {}
};

// ============================================================================
// Profiles
// ============================================================================

class ProfileError : public FerryError {
public:
  ProfileError(const std::string& message, const std::string& profile_name = "")
      : FerryError(message)
      , profile_name_(profile_name) {}

  const std::string& profileName() const { return profile_name_; }

private:
  std::string profile_name_;
};

class ProfileNotFoundError : public ProfileError {
public:
  explicit ProfileNotFoundError(const std::string& profile_name)
      : ProfileError("Profile '" + profile_name + "' was not found.", profile_name) {}
};

class ProfileAlreadyExistsError : public ProfileError {
public:
  explicit ProfileAlreadyExistsError(const std::string& profile_name)
      : ProfileError("Profile '" + profile_name + "' already exists.", profile_name) {}
};

class ProfileValidationError : public ProfileError {
public:
  ProfileValidationError(const std::string& profile_name, const std::vector<std::string>& errors)
      : ProfileError(format(errors), profile_name)
      , errors_(errors) {}

  const std::vector<std::string>& errors() const { return errors_; }

private:
  static std::string format(const std::vector<std::string>& errors) {
    std::string message = "Profile validation failed: ";
    for (size_t i = 0; i < errors.size(); ++i) {
      if (i > 0) {
        message += "; ";
      }
      message += errors[i];
    }
    return message;
  }

  std::vector<std::string> errors_;
};

class ProfileStorageError : public ProfileError {
public:
  ProfileStorageError(const std::string& message, const std::string& profile_name = "")
      : ProfileError(message, profile_name) {}
};

}  // namespace ferry

#endif  // FERRY_ERRORS_HPP
