// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "sftp_transfer_client.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>

#include "ferry_errors.hpp"

#define FERRY_LOG_COMPONENT "sftp_client"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace transfer {

using ::ferry::logging::kv;

namespace {

constexpr size_t kUploadChunkSize = 64 * 1024;
constexpr int kKeepAliveIntervalSeconds = 30;

std::once_flag g_libssh2_init_flag;

void ensureLibssh2Initialized() {
  std::call_once(g_libssh2_init_flag, [] {
    if (libssh2_init(0) != 0) {
      throw ConnectionError("libssh2 initialization failed.", "", 0, false);
    }
  });
}

bool isCancelled(const CancellationToken* token) {
  return token != nullptr && token->isCancelled();
}

std::chrono::system_clock::time_point fromEpochSeconds(unsigned long seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

}  // namespace

// ============================================================================
// Connection lifecycle
// ============================================================================

SftpTransferClient::SftpTransferClient(const ConnectionConfig& config)
    : config_(config) {}

SftpTransferClient::~SftpTransferClient() {
  disconnect();
}

bool SftpTransferClient::isConnected() const {
  return connected_ && session_ != nullptr && sftp_ != nullptr;
}

int SftpTransferClient::openSocket(const CancellationToken* token) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* addresses = nullptr;
  const std::string port = std::to_string(config_.port);
  const int gai = getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &addresses);
  if (gai != 0) {
    throw ConnectionError(
      std::string("Cannot resolve host '") + config_.host + "': " + gai_strerror(gai),
      config_.host, config_.port, true
    );
  }

  const int timeout_ms = static_cast<int>(
    std::chrono::duration_cast<std::chrono::milliseconds>(config_.connection_timeout).count()
  );
  int last_errno = 0;
  bool timed_out = false;
  int connected_fd = -1;

  for (addrinfo* ai = addresses; ai != nullptr && connected_fd < 0; ai = ai->ai_next) {
    if (isCancelled(token)) {
      break;
    }
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }

    // Non-blocking connect so the configured timeout applies.
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      rc = ::poll(&pfd, 1, timeout_ms);
      if (rc == 0) {
        timed_out = true;
        last_errno = ETIMEDOUT;
        ::close(fd);
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      rc = (rc > 0 && so_error == 0) ? 0 : -1;
      errno = so_error != 0 ? so_error : errno;
    }

    if (rc != 0) {
      last_errno = errno;
      ::close(fd);
      continue;
    }

    ::fcntl(fd, F_SETFL, flags);
    if (config_.keep_alive) {
      int opt = 1;
      ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
    }
    connected_fd = fd;
  }
  freeaddrinfo(addresses);

  if (connected_fd >= 0) {
    return connected_fd;
  }
  if (isCancelled(token)) {
    throw OperationCancelled("Connection to " + config_.host + " was cancelled.");
  }
  if (timed_out && last_errno == ETIMEDOUT) {
    throw ConnectionTimeoutError(
      config_.host, config_.port, static_cast<double>(config_.connection_timeout.count())
    );
  }
  if (last_errno == ECONNREFUSED) {
    throw ConnectionRefusedError(config_.host, config_.port);
  }
  throw ConnectionError(
    "Cannot connect to " + config_.host + ":" + std::to_string(config_.port) + ": " +
      std::strerror(last_errno),
    config_.host, config_.port, true
  );
}

void SftpTransferClient::connect(const CancellationToken* token) {
  if (isConnected()) {
    return;
  }
  disconnect();
  ensureLibssh2Initialized();

  if (token) {
    token->throwIfCancelled();
  }
  FERRY_LOG_DEBUG("Connecting" << kv("host", config_.host) << kv("port", config_.port));

  socket_ = openSocket(token);

  session_ = libssh2_session_init();
  if (!session_) {
    disconnect();
    throw ConnectionError("Cannot allocate SSH session.", config_.host, config_.port, false);
  }
  libssh2_session_set_blocking(session_, 1);
  libssh2_session_set_timeout(
    session_,
    static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.connection_timeout).count()
    )
  );

  if (libssh2_session_handshake(session_, socket_) != 0) {
    const std::string error = lastSessionError();
    disconnect();
    throw ConnectionError(
      "SSH handshake with " + config_.host + " failed: " + error, config_.host, config_.port, true
    );
  }
  if (config_.keep_alive) {
    libssh2_keepalive_config(session_, 1, kKeepAliveIntervalSeconds);
  }

  try {
    verifyHostKey();
    if (token) {
      token->throwIfCancelled();
    }
    authenticate();
  } catch (...) {
    disconnect();
    throw;
  }

  sftp_ = libssh2_sftp_init(session_);
  if (!sftp_) {
    const std::string error = lastSessionError();
    disconnect();
    throw ConnectionError(
      "Cannot start SFTP subsystem on " + config_.host + ": " + error, config_.host, config_.port,
      true
    );
  }

  connected_ = true;
  FERRY_LOG_INFO("Connected" << kv("host", config_.host) << kv("user", config_.username));
}

void SftpTransferClient::verifyHostKey() {
  size_t key_length = 0;
  int key_type = 0;
  const char* host_key = libssh2_session_hostkey(session_, &key_length, &key_type);
  if (!host_key || key_length == 0) {
    throw SslCertificateError(
      "Server " + config_.host + " did not present a host key.", config_.host, config_.port
    );
  }

  if (config_.known_hosts_file.empty()) {
    FERRY_LOG_WARN("Host key not verified, no known_hosts file configured" << kv("host", config_.host));
    return;
  }

  LIBSSH2_KNOWNHOSTS* known_hosts = libssh2_knownhost_init(session_);
  if (!known_hosts) {
    throw SslCertificateError("Cannot initialize known hosts store.", config_.host, config_.port);
  }
  if (libssh2_knownhost_readfile(
        known_hosts, config_.known_hosts_file.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH
      ) < 0) {
    libssh2_knownhost_free(known_hosts);
    throw SslCertificateError(
      "Cannot read known hosts file '" + config_.known_hosts_file + "'.", config_.host,
      config_.port
    );
  }

  libssh2_knownhost* entry = nullptr;
  int check = libssh2_knownhost_checkp(
    known_hosts, config_.host.c_str(), config_.port, host_key, key_length,
    LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW, &entry
  );
  libssh2_knownhost_free(known_hosts);

  if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
    return;
  }
  if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
    throw SslCertificateError(
      "Host key for " + config_.host + " does not match the known hosts entry.", config_.host,
      config_.port
    );
  }
  throw SslCertificateError(
    "Host " + config_.host + " is not listed in '" + config_.known_hosts_file + "'.", config_.host,
    config_.port
  );
}

void SftpTransferClient::authenticate() {
  int rc = 0;
  if (!config_.private_key_file.empty()) {
    rc = libssh2_userauth_publickey_fromfile(
      session_, config_.username.c_str(), nullptr, config_.private_key_file.c_str(),
      config_.password.empty() ? nullptr : config_.password.c_str()
    );
  } else {
    rc = libssh2_userauth_password(session_, config_.username.c_str(), config_.password.c_str());
  }

  if (rc == 0) {
    return;
  }
  if (rc == LIBSSH2_ERROR_TIMEOUT || rc == LIBSSH2_ERROR_SOCKET_RECV ||
      rc == LIBSSH2_ERROR_SOCKET_SEND) {
    throw ConnectionError(
      "Connection lost during authentication: " + lastSessionError(), config_.host, config_.port,
      true
    );
  }
  throw InvalidCredentialsError(config_.username, config_.host);
}

void SftpTransferClient::disconnect() {
  if (sftp_) {
    libssh2_sftp_shutdown(sftp_);
    sftp_ = nullptr;
  }
  if (session_) {
    libssh2_session_disconnect(session_, "Normal Shutdown");
    libssh2_session_free(session_);
    session_ = nullptr;
  }
  if (socket_ >= 0) {
    ::close(socket_);
    socket_ = -1;
  }
  if (connected_) {
    FERRY_LOG_DEBUG("Disconnected" << kv("host", config_.host));
  }
  connected_ = false;
}

void SftpTransferClient::dispose() {
  disconnect();
}

bool SftpTransferClient::testConnection(const CancellationToken* token) {
  try {
    connect(token);
  } catch (const FerryError& e) {
    FERRY_LOG_WARN("Connection test failed" << kv("host", config_.host) << kv("error", e.what()));
    return false;
  }
  return isConnected();
}

void SftpTransferClient::requireConnected(const char* operation) const {
  if (!isConnected()) {
    throw ConnectionError(
      std::string("Cannot ") + operation + ": not connected to " + config_.host + ".", config_.host,
      config_.port, true
    );
  }
}

std::string SftpTransferClient::lastSessionError() const {
  if (!session_) {
    return "no session";
  }
  char* message = nullptr;
  int length = 0;
  libssh2_session_last_error(session_, &message, &length, 0);
  return (message && length > 0) ? std::string(message, static_cast<size_t>(length))
                                 : std::string("unknown error");
}

// ============================================================================
// File operations
// ============================================================================

bool SftpTransferClient::uploadFile(
  const std::string& local_path, const std::string& remote_path, bool overwrite,
  bool create_directories, const CancellationToken* token
) {
  requireConnected("upload");

  if (!overwrite && fileExists(remote_path)) {
    FERRY_LOG_DEBUG("Skipping existing remote file" << kv("remote", remote_path));
    return false;
  }
  if (create_directories) {
    ensureDirectoryTree(remoteParentPath(remote_path));
  }

  std::ifstream input(local_path, std::ios::binary);
  if (!input) {
    throw FileTransferError(local_path, remote_path);
  }

  LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_open(
    sftp_, remote_path.c_str(), LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
    LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH
  );
  if (!handle) {
    const unsigned long sftp_error = libssh2_sftp_last_error(sftp_);
    if (sftp_error == LIBSSH2_FX_PERMISSION_DENIED) {
      throw InsufficientPermissionsError(config_.username, config_.host, "write '" + remote_path + "'");
    }
    if (sftp_error == LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM || sftp_error == LIBSSH2_FX_QUOTA_EXCEEDED) {
      throw InsufficientDiskSpaceError(remote_path);
    }
    throw FileTransferError(local_path, remote_path);
  }

  std::vector<char> buffer(kUploadChunkSize);
  while (input) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read = input.gcount();
    if (read <= 0) {
      break;
    }

    const char* cursor = buffer.data();
    size_t remaining = static_cast<size_t>(read);
    while (remaining > 0) {
      if (isCancelled(token)) {
        libssh2_sftp_close(handle);
        throw OperationCancelled("Upload of '" + remote_path + "' was cancelled.");
      }
      const ssize_t written = libssh2_sftp_write(handle, cursor, remaining);
      if (written < 0) {
        libssh2_sftp_close(handle);
        if (written == LIBSSH2_ERROR_SOCKET_SEND || written == LIBSSH2_ERROR_TIMEOUT ||
            written == LIBSSH2_ERROR_SOCKET_DISCONNECT) {
          // Session is unusable; the engine reconnects before the next attempt.
          disconnect();
        }
        throw FileTransferError(local_path, remote_path);
      }
      cursor += written;
      remaining -= static_cast<size_t>(written);
    }
  }

  if (input.bad()) {
    libssh2_sftp_close(handle);
    throw FileTransferError(local_path, remote_path);
  }
  libssh2_sftp_close(handle);
  return true;
}

void SftpTransferClient::ensureDirectoryTree(const std::string& remote_dir) {
  if (remote_dir.empty() || remote_dir == "/" || directoryExists(remote_dir)) {
    return;
  }
  ensureDirectoryTree(remoteParentPath(remote_dir));
  createDirectory(remote_dir);
}

void SftpTransferClient::createDirectory(const std::string& remote_path) {
  requireConnected("create directory");
  const int rc = libssh2_sftp_mkdir(
    sftp_, remote_path.c_str(),
    LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IXGRP | LIBSSH2_SFTP_S_IROTH |
      LIBSSH2_SFTP_S_IXOTH
  );
  // Another worker may have created it first.
  if (rc != 0 && !directoryExists(remote_path)) {
    throw DeploymentError(
      "Failed to create remote directory '" + remote_path + "'.", "", DeploymentPhase::Upload,
      true
    );
  }
}

bool SftpTransferClient::directoryExists(const std::string& remote_path) {
  requireConnected("stat");
  LIBSSH2_SFTP_ATTRIBUTES attrs{};
  if (libssh2_sftp_stat(sftp_, remote_path.c_str(), &attrs) != 0) {
    return false;
  }
  return (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
}

bool SftpTransferClient::fileExists(const std::string& remote_path) {
  requireConnected("stat");
  LIBSSH2_SFTP_ATTRIBUTES attrs{};
  if (libssh2_sftp_stat(sftp_, remote_path.c_str(), &attrs) != 0) {
    return false;
  }
  return !(attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) || LIBSSH2_SFTP_S_ISREG(attrs.permissions);
}

std::vector<RemoteFileInfo> SftpTransferClient::listDirectory(const std::string& remote_path) {
  requireConnected("list directory");
  const std::string path = remote_path.empty() ? "/" : remote_path;

  LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
  if (!dir) {
    throw DeploymentError(
      "Failed to list remote directory '" + path + "'.", "", DeploymentPhase::Verification, true
    );
  }

  std::vector<RemoteFileInfo> entries;
  char name[1024];
  char long_entry[1024];
  while (true) {
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    const int rc =
      libssh2_sftp_readdir_ex(dir, name, sizeof(name), long_entry, sizeof(long_entry), &attrs);
    if (rc == 0) {
      break;
    }
    if (rc < 0) {
      libssh2_sftp_closedir(dir);
      throw DeploymentError(
        "Failed to read remote directory '" + path + "'.", "", DeploymentPhase::Verification, true
      );
    }

    RemoteFileInfo info;
    info.name.assign(name, static_cast<size_t>(rc));
    if (info.name == "." || info.name == "..") {
      continue;
    }
    info.full_path = joinRemotePath(path, info.name);
    info.is_directory =
      (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
      info.size = attrs.filesize;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
      info.last_modified = fromEpochSeconds(attrs.mtime);
    }
    entries.push_back(std::move(info));
  }

  libssh2_sftp_closedir(dir);
  return entries;
}

void SftpTransferClient::deleteFile(const std::string& remote_path) {
  requireConnected("delete file");
  if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
    throw DeploymentError(
      "Failed to delete remote file '" + remote_path + "'.", "", DeploymentPhase::Upload, false
    );
  }
}

void SftpTransferClient::deleteDirectory(const std::string& remote_path) {
  requireConnected("delete directory");
  if (libssh2_sftp_rmdir(sftp_, remote_path.c_str()) != 0) {
    throw DeploymentError(
      "Failed to delete remote directory '" + remote_path + "'.", "", DeploymentPhase::Upload,
      false
    );
  }
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<ITransferClient> TransferClientFactory::createClient(
  const ConnectionConfig& config
) {
  switch (config.protocol) {
    case TransferProtocol::Sftp:
      return std::make_unique<SftpTransferClient>(config);
    case TransferProtocol::Ftp:
      break;
  }
  throw ConfigurationError(
    std::string("Protocol ") + protocolToString(config.protocol) +
    " is not supported. Use SFTP for host " + config.host + "."
  );
}

}  // namespace transfer
}  // namespace ferry
