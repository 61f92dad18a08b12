// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_TRANSFER_CLIENT_HPP
#define FERRY_TRANSFER_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "cancellation_token.hpp"

namespace ferry {
namespace transfer {

enum class TransferProtocol { Ftp, Sftp };

const char* protocolToString(TransferProtocol protocol);

/**
 * Everything a client needs to open a session.
 */
struct ConnectionConfig {
  TransferProtocol protocol = TransferProtocol::Sftp;
  std::string host;
  int port = 22;
  std::string username;
  std::string password;
  std::string private_key_file;  // preferred over password when set
  std::string known_hosts_file;  // host key is not verified when empty
  std::chrono::seconds connection_timeout{30};
  std::string remote_root = "/";
  bool keep_alive = true;
};

/**
 * One entry of a remote directory listing.
 */
struct RemoteFileInfo {
  std::string full_path;
  std::string name;
  bool is_directory = false;
  uint64_t size = 0;
  std::chrono::system_clock::time_point last_modified;
};

/**
 * Session with a remote file server.
 *
 * A client is used by one thread at a time. The engine leases it to a single
 * worker and only returns it to the pool between files.
 */
class ITransferClient {
public:
  virtual ~ITransferClient() = default;

  virtual bool isConnected() const = 0;

  /**
   * @throws ConnectionError, AuthenticationError, OperationCancelled
   */
  virtual void connect(const CancellationToken* token) = 0;

  virtual void disconnect() = 0;

  /**
   * Upload one file.
   *
   * @return false when the server declined the write without an error,
   *         e.g. overwrite is false and the file exists
   * @throws FileTransferError or ConnectionError on transport failures
   */
  virtual bool uploadFile(
    const std::string& local_path, const std::string& remote_path, bool overwrite,
    bool create_directories, const CancellationToken* token
  ) = 0;

  virtual void createDirectory(const std::string& remote_path) = 0;
  virtual bool directoryExists(const std::string& remote_path) = 0;
  virtual bool fileExists(const std::string& remote_path) = 0;

  /**
   * Entries directly under remote_path, without "." and "..".
   */
  virtual std::vector<RemoteFileInfo> listDirectory(const std::string& remote_path) = 0;

  virtual void deleteFile(const std::string& remote_path) = 0;
  virtual void deleteDirectory(const std::string& remote_path) = 0;

  /**
   * Open and close a session without touching any file.
   */
  virtual bool testConnection(const CancellationToken* token) = 0;

  /**
   * Release the session and any native handles. Safe to call twice.
   */
  virtual void dispose() = 0;
};

class ITransferClientFactory {
public:
  virtual ~ITransferClientFactory() = default;

  /**
   * Create an unconnected client for config.
   *
   * @throws ConfigurationError for unsupported protocols
   */
  virtual std::unique_ptr<ITransferClient> createClient(const ConnectionConfig& config) = 0;
};

/**
 * Depth-first listing of every file and directory below root.
 */
std::vector<RemoteFileInfo> listRemoteTree(ITransferClient& client, const std::string& root);

/**
 * Join a remote root and a relative path with exactly one '/'. Backslashes in
 * relative are converted.
 */
std::string joinRemotePath(const std::string& root, const std::string& relative);

/**
 * Parent directory of a remote path, "/" for top-level entries.
 */
std::string remoteParentPath(const std::string& remote_path);

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_TRANSFER_CLIENT_HPP
