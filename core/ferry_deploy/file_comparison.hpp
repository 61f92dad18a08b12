// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_FILE_COMPARISON_HPP
#define FERRY_FILE_COMPARISON_HPP

#include <string>
#include <vector>

#include "publish_output_scanner.hpp"

namespace ferry {
namespace deploy {

class ExclusionPatternMatcher;

struct ComparisonResult {
  std::vector<std::string> obsolete_files;  // on the server but not in the publish output
  std::vector<std::string> excluded_files;  // obsolete but protected by an exclusion pattern
  size_t total_local = 0;
  size_t total_remote = 0;

  size_t obsoleteCount() const { return obsolete_files.size(); }
  size_t excludedCount() const { return excluded_files.size(); }
};

/**
 * Works out which remote files a cleanup pass may delete.
 *
 * All paths are relative to the deployment root and compared
 * case-insensitively after normalizePath().
 */
class FileComparison {
public:
  static ComparisonResult compare(
    const std::vector<FileMetadata>& local_files, const std::vector<std::string>& remote_files,
    const ExclusionPatternMatcher* matcher = nullptr
  );

  static ComparisonResult compare(
    const std::vector<std::string>& local_paths, const std::vector<std::string>& remote_files,
    const ExclusionPatternMatcher* matcher = nullptr
  );

  /**
   * Directories that hold nothing but obsolete files, deepest first so they
   * can be removed in order.
   */
  static std::vector<std::string> identifyEmptyDirectories(
    const std::vector<std::string>& obsolete_files, const std::vector<std::string>& remote_files
  );

  /**
   * Forward slashes, no surrounding whitespace or slashes.
   */
  static std::string normalizePath(const std::string& path);
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_FILE_COMPARISON_HPP
