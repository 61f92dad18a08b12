// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_client.hpp"

#include <algorithm>

namespace ferry {
namespace transfer {

const char* protocolToString(TransferProtocol protocol) {
  switch (protocol) {
    case TransferProtocol::Ftp:
      return "FTP";
    case TransferProtocol::Sftp:
      return "SFTP";
  }
  return "Unknown";
}

std::vector<RemoteFileInfo> listRemoteTree(ITransferClient& client, const std::string& root) {
  std::vector<RemoteFileInfo> all;
  std::vector<std::string> pending{root};

  while (!pending.empty()) {
    std::string dir = pending.back();
    pending.pop_back();

    for (auto& entry : client.listDirectory(dir)) {
      if (entry.name == "." || entry.name == "..") {
        continue;
      }
      if (entry.is_directory) {
        pending.push_back(entry.full_path);
      }
      all.push_back(std::move(entry));
    }
  }
  return all;
}

std::string joinRemotePath(const std::string& root, const std::string& relative) {
  std::string rel = relative;
  std::replace(rel.begin(), rel.end(), '\\', '/');
  while (!rel.empty() && rel.front() == '/') {
    rel.erase(rel.begin());
  }

  std::string base = root.empty() ? "/" : root;
  if (base.back() != '/') {
    base += '/';
  }
  return base + rel;
}

std::string remoteParentPath(const std::string& remote_path) {
  const auto pos = remote_path.find_last_of('/');
  if (pos == std::string::npos || pos == 0) {
    return "/";
  }
  return remote_path.substr(0, pos);
}

}  // namespace transfer
}  // namespace ferry
