// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_BUILD_TOOL_HPP
#define FERRY_BUILD_TOOL_HPP

#include <chrono>
#include <string>
#include <vector>

#include "cancellation_token.hpp"

namespace ferry {
namespace deploy {

struct BuildResult {
  bool success = false;
  int exit_code = -1;
  std::string output;
  std::string error_output;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  std::chrono::milliseconds duration{0};
  std::string output_path;  // publish directory
};

/**
 * Compiles and publishes a project into a directory ready for upload.
 */
class IBuildTool {
public:
  virtual ~IBuildTool() = default;

  /**
   * A failed compilation is reported through BuildResult::success, not by
   * throwing.
   *
   * @throws BuildToolNotFoundError if the tool is not installed
   * @throws OperationCancelled if token is cancelled while building
   */
  virtual BuildResult build(
    const std::string& project_path, const std::string& output_dir,
    const std::string& configuration, const CancellationToken* token
  ) = 0;
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_BUILD_TOOL_HPP
