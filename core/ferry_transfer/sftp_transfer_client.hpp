// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_SFTP_TRANSFER_CLIENT_HPP
#define FERRY_SFTP_TRANSFER_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>

#include "transfer_client.hpp"

// libssh2 handles, kept opaque to users of this header
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace ferry {
namespace transfer {

/**
 * ITransferClient over SSH/SFTP using libssh2 in blocking mode.
 *
 * Authenticates with the private key file when one is configured, otherwise
 * with the password. When known_hosts_file is set the server host key must
 * match an entry in it.
 */
class SftpTransferClient : public ITransferClient {
public:
  explicit SftpTransferClient(const ConnectionConfig& config);
  ~SftpTransferClient() override;

  SftpTransferClient(const SftpTransferClient&) = delete;
  SftpTransferClient& operator=(const SftpTransferClient&) = delete;

  bool isConnected() const override;
  void connect(const CancellationToken* token) override;
  void disconnect() override;

  bool uploadFile(
    const std::string& local_path, const std::string& remote_path, bool overwrite,
    bool create_directories, const CancellationToken* token
  ) override;

  void createDirectory(const std::string& remote_path) override;
  bool directoryExists(const std::string& remote_path) override;
  bool fileExists(const std::string& remote_path) override;
  std::vector<RemoteFileInfo> listDirectory(const std::string& remote_path) override;
  void deleteFile(const std::string& remote_path) override;
  void deleteDirectory(const std::string& remote_path) override;
  bool testConnection(const CancellationToken* token) override;
  void dispose() override;

private:
  int openSocket(const CancellationToken* token);
  void verifyHostKey();
  void authenticate();
  void ensureDirectoryTree(const std::string& remote_dir);
  void requireConnected(const char* operation) const;
  std::string lastSessionError() const;

  ConnectionConfig config_;
  int socket_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP* sftp_ = nullptr;
  bool connected_ = false;
};

/**
 * Creates protocol clients. Only SFTP is available.
 */
class TransferClientFactory : public ITransferClientFactory {
public:
  /**
   * @throws ConfigurationError for TransferProtocol::Ftp
   */
  std::unique_ptr<ITransferClient> createClient(const ConnectionConfig& config) override;
};

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_SFTP_TRANSFER_CLIENT_HPP
