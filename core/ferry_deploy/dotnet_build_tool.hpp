// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DOTNET_BUILD_TOOL_HPP
#define FERRY_DOTNET_BUILD_TOOL_HPP

#include <chrono>
#include <string>
#include <vector>

#include "build_tool.hpp"

namespace ferry {
namespace deploy {

/**
 * Runs `dotnet publish` as a child process.
 */
class DotnetBuildTool : public IBuildTool {
public:
  explicit DotnetBuildTool(std::string executable = "dotnet");

  BuildResult build(
    const std::string& project_path, const std::string& output_dir,
    const std::string& configuration, const CancellationToken* token
  ) override;

  void setPollInterval(std::chrono::milliseconds interval) { poll_interval_ = interval; }

  /**
   * Arguments passed after the executable name.
   */
  static std::vector<std::string> publishArguments(
    const std::string& project_path, const std::string& output_dir,
    const std::string& configuration
  );

private:
  std::string executable_;
  std::chrono::milliseconds poll_interval_{200};
};

/**
 * MSBuild diagnostics found in build output, one line each.
 */
struct BuildDiagnostics {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

/**
 * Collect lines shaped like "file(1,2): error CS0103: ..." and
 * "warning NU1701: ...". Duplicate lines are reported once.
 */
BuildDiagnostics parseBuildDiagnostics(const std::string& output);

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_DOTNET_BUILD_TOOL_HPP
