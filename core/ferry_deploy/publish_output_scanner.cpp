// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "publish_output_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "exclusion_pattern_matcher.hpp"
#include "ferry_errors.hpp"

#define FERRY_LOG_COMPONENT "publish_scanner"
#include <ferry_log_macros.hpp>

using ::ferry::logging::kv;

namespace fs = std::filesystem;

namespace ferry {
namespace deploy {

namespace {

constexpr uint64_t kLargeFileBytes = 100ULL * 1024 * 1024;

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

std::chrono::system_clock::time_point toSystemClock(fs::file_time_type file_time) {
  // file_clock has no portable conversion in C++17
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
    file_time - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
  );
}

void checkOutput(PublishOutput& output) {
  if (output.files.empty()) {
    output.errors.push_back("No files found in publish output. The build may have failed.");
    return;
  }

  const bool has_assemblies =
    std::any_of(output.files.begin(), output.files.end(), [](const FileMetadata& f) {
      return f.isAssembly();
    });
  const bool has_web_config =
    std::any_of(output.files.begin(), output.files.end(), [](const FileMetadata& f) {
      return f.isWebConfig();
    });
  const bool has_html =
    std::any_of(output.files.begin(), output.files.end(), [](const FileMetadata& f) {
      return equalsIgnoreCase(f.extension, ".html") || equalsIgnoreCase(f.extension, ".htm");
    });

  if (has_assemblies && !has_web_config && has_html) {
    output.warnings.push_back(
      "Web application detected but web.config is missing. This may cause deployment issues on "
      "IIS."
    );
  }

  for (const auto& file : output.files) {
    if (file.size > kLargeFileBytes) {
      output.warnings.push_back(
        "Large file detected: " + file.relative_path + " (" + formatBytes(file.size) +
        "). This may slow down deployment."
      );
    }
    if (equalsIgnoreCase(file.file_name, "appsettings.Development.json") ||
        equalsIgnoreCase(file.file_name, "launchSettings.json")) {
      output.warnings.push_back(
        "Development file detected: " + file.relative_path +
        ". Consider excluding this from production deployments."
      );
    }
  }

  if (!has_assemblies) {
    output.warnings.push_back(
      "No assemblies (.dll or .exe) found in publish output. This may not be a complete build."
    );
  }
  if (output.total_size == 0) {
    output.errors.push_back("Total size is 0 bytes. The publish output appears to be empty.");
  }
}

}  // namespace

bool FileMetadata::isAssembly() const {
  return equalsIgnoreCase(extension, ".dll") || equalsIgnoreCase(extension, ".exe");
}

bool FileMetadata::isWebConfig() const {
  return equalsIgnoreCase(file_name, "web.config");
}

std::string formatBytes(uint64_t bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  char buf[32];
  if (unit == 0) {
    std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
  }
  return buf;
}

const std::vector<std::string>& PublishOutputScanner::defaultExclusions() {
  static const std::vector<std::string> patterns = {
    "*.pdb", "*.xml", "*.map", ".git/**", ".vs/**", "obj/**", "*.vshost.*", "*.manifest",
  };
  return patterns;
}

PublishOutput PublishOutputScanner::scan(
  const std::string& publish_dir, const std::vector<std::string>& extra_exclusions
) const {
  if (publish_dir.empty()) {
    throw std::invalid_argument("Publish directory cannot be empty.");
  }

  std::error_code ec;
  if (!fs::is_directory(publish_dir, ec)) {
    throw BuildError("Publish output directory not found: " + publish_dir);
  }

  std::vector<std::string> patterns = defaultExclusions();
  patterns.insert(patterns.end(), extra_exclusions.begin(), extra_exclusions.end());
  const ExclusionPatternMatcher matcher(patterns);

  PublishOutput output;
  const fs::path root = fs::absolute(publish_dir);
  output.root_path = root.string();

  int skipped = 0;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }

    const std::string relative = it->path().lexically_relative(root).generic_string();
    if (matcher.isExcluded(relative)) {
      ++skipped;
      continue;
    }

    FileMetadata meta;
    meta.absolute_path = it->path().string();
    meta.relative_path = relative;
    meta.size = static_cast<uint64_t>(it->file_size(ec));
    meta.last_modified = toSystemClock(it->last_write_time(ec));
    meta.file_name = it->path().filename().string();
    meta.extension = it->path().extension().string();
    output.total_size += meta.size;
    output.files.push_back(std::move(meta));
  }
  if (ec) {
    throw BuildError("Failed to scan publish output '" + publish_dir + "': " + ec.message());
  }

  std::sort(output.files.begin(), output.files.end(), [](const FileMetadata& a, const FileMetadata& b) {
    return a.relative_path < b.relative_path;
  });

  checkOutput(output);

  FERRY_LOG_DEBUG(
    "Scanned publish output" << kv("root", output.root_path) << kv("files", output.files.size())
                             << kv("excluded", skipped) << kv("bytes", output.total_size)
  );
  return output;
}

}  // namespace deploy
}  // namespace ferry
