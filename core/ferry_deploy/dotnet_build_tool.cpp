// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "dotnet_build_tool.hpp"

#include <boost/filesystem.hpp>
#include <boost/process.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <regex>
#include <set>
#include <sstream>
#include <system_error>
#include <thread>

#include "ferry_errors.hpp"

#define FERRY_LOG_COMPONENT "build"
#include <ferry_log_macros.hpp>

using ::ferry::logging::kv;

namespace bp = boost::process;

namespace ferry {
namespace deploy {

namespace {

std::string readFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return "";
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Scratch files for the child's stdout/stderr, removed on scope exit
class CaptureFiles {
public:
  CaptureFiles() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned int> dist;
    const auto base = std::filesystem::temp_directory_path() /
                      ("ferry-build-" + std::to_string(dist(gen)));
    out_ = base.string() + ".out";
    err_ = base.string() + ".err";
  }

  ~CaptureFiles() {
    std::error_code ec;
    std::filesystem::remove(out_, ec);
    std::filesystem::remove(err_, ec);
  }

  CaptureFiles(const CaptureFiles&) = delete;
  CaptureFiles& operator=(const CaptureFiles&) = delete;

  const std::string& out() const { return out_; }
  const std::string& err() const { return err_; }

private:
  std::string out_;
  std::string err_;
};

}  // namespace

BuildDiagnostics parseBuildDiagnostics(const std::string& output) {
  static const std::regex error_re(R"(error\s+[A-Z]+\d+:)");
  static const std::regex warning_re(R"(warning\s+[A-Z]+\d+:)");

  BuildDiagnostics diagnostics;
  std::set<std::string> seen_errors;
  std::set<std::string> seen_warnings;

  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto first = line.find_first_not_of(" \t");
    if (first == std::string::npos) {
      continue;
    }
    line.erase(0, first);

    if (std::regex_search(line, error_re)) {
      if (seen_errors.insert(line).second) {
        diagnostics.errors.push_back(line);
      }
    } else if (std::regex_search(line, warning_re)) {
      if (seen_warnings.insert(line).second) {
        diagnostics.warnings.push_back(line);
      }
    }
  }
  return diagnostics;
}

DotnetBuildTool::DotnetBuildTool(std::string executable)
    : executable_(std::move(executable)) {}

std::vector<std::string> DotnetBuildTool::publishArguments(
  const std::string& project_path, const std::string& output_dir, const std::string& configuration
) {
  return {
    "publish", project_path, "--configuration", configuration, "--output", output_dir, "--nologo",
  };
}

BuildResult DotnetBuildTool::build(
  const std::string& project_path, const std::string& output_dir, const std::string& configuration,
  const CancellationToken* token
) {
  if (token != nullptr) {
    token->throwIfCancelled();
  }

  boost::filesystem::path exe;
  if (executable_.find('/') != std::string::npos) {
    exe = executable_;
    if (!boost::filesystem::exists(exe)) {
      exe.clear();
    }
  } else {
    exe = bp::search_path(executable_);
  }
  if (exe.empty()) {
    throw BuildToolNotFoundError(executable_);
  }

  const auto args = publishArguments(project_path, output_dir, configuration);
  FERRY_LOG_INFO(
    "Starting build" << kv("project", project_path) << kv("configuration", configuration)
                     << kv("output", output_dir)
  );

  CaptureFiles capture;
  const auto start = std::chrono::steady_clock::now();

  std::error_code launch_ec;
  bp::child child(
    exe, bp::args(args), bp::std_out > capture.out(), bp::std_err > capture.err(),
    bp::std_in.close(), launch_ec
  );
  if (launch_ec) {
    throw BuildError(
      "Failed to start " + exe.string() + ": " + launch_ec.message(), project_path, configuration
    );
  }

  // running() reaps the child with WNOHANG, so polling never blocks past the interval
  std::error_code wait_ec;
  while (child.running(wait_ec)) {
    if (token != nullptr && token->waitFor(poll_interval_)) {
      FERRY_LOG_WARN("Build cancelled, terminating" << kv("pid", child.id()));
      std::error_code term_ec;
      child.terminate(term_ec);
      throw OperationCancelled("Build was cancelled.");
    }
    if (token == nullptr) {
      std::this_thread::sleep_for(poll_interval_);
    }
  }
  if (wait_ec) {
    throw BuildError(
      "Failed to wait for build process: " + wait_ec.message(), project_path, configuration
    );
  }

  BuildResult result;
  result.exit_code = child.exit_code();
  result.output = readFile(capture.out());
  result.error_output = readFile(capture.err());
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start
  );
  result.output_path = output_dir;

  auto diagnostics = parseBuildDiagnostics(result.output + "\n" + result.error_output);
  result.errors = std::move(diagnostics.errors);
  result.warnings = std::move(diagnostics.warnings);
  result.success = result.exit_code == 0 && result.errors.empty();

  if (result.success) {
    FERRY_LOG_INFO(
      "Build succeeded" << kv("duration_ms", result.duration.count())
                        << kv("warnings", result.warnings.size())
    );
  } else {
    FERRY_LOG_ERROR(
      "Build failed" << kv("exit_code", result.exit_code) << kv("errors", result.errors.size())
    );
  }
  return result;
}

}  // namespace deploy
}  // namespace ferry
