// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_PUBLISH_OUTPUT_SCANNER_HPP
#define FERRY_PUBLISH_OUTPUT_SCANNER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ferry {
namespace deploy {

struct FileMetadata {
  std::string absolute_path;
  std::string relative_path;  // '/' separated, relative to the publish root
  uint64_t size = 0;
  std::chrono::system_clock::time_point last_modified;
  std::string file_name;
  std::string extension;  // including the dot, e.g. ".dll"

  bool isAssembly() const;
  bool isWebConfig() const;
};

struct PublishOutput {
  std::string root_path;
  std::vector<FileMetadata> files;
  uint64_t total_size = 0;
  std::vector<std::string> warnings;
  std::vector<std::string> errors;

  size_t fileCount() const { return files.size(); }
};

/**
 * Enumerates the files of a publish directory, skipping build artifacts that
 * never belong on a server (*.pdb, obj/ and similar) plus caller patterns.
 */
class PublishOutputScanner {
public:
  static const std::vector<std::string>& defaultExclusions();

  /**
   * Scan publish_dir recursively.
   *
   * Files are sorted by relative path. The output is checked for common
   * problems, which land in PublishOutput::warnings and ::errors.
   *
   * @throws std::invalid_argument if publish_dir is empty
   * @throws BuildError if publish_dir is not a directory
   */
  PublishOutput scan(
    const std::string& publish_dir, const std::vector<std::string>& extra_exclusions = {}
  ) const;
};

/**
 * "1.5 KB" style size rendering.
 */
std::string formatBytes(uint64_t bytes);

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_PUBLISH_OUTPUT_SCANNER_HPP
