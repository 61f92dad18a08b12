// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_comparison.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

#include "exclusion_pattern_matcher.hpp"

namespace ferry {
namespace deploy {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

size_t depthOf(const std::string& path) {
  return static_cast<size_t>(std::count(path.begin(), path.end(), '/'));
}

}  // namespace

std::string FileComparison::normalizePath(const std::string& path) {
  std::string result = path;
  std::replace(result.begin(), result.end(), '\\', '/');

  const auto first = result.find_first_not_of(" \t\r\n/");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = result.find_last_not_of(" \t\r\n/");
  return result.substr(first, last - first + 1);
}

ComparisonResult FileComparison::compare(
  const std::vector<FileMetadata>& local_files, const std::vector<std::string>& remote_files,
  const ExclusionPatternMatcher* matcher
) {
  std::vector<std::string> local_paths;
  local_paths.reserve(local_files.size());
  for (const auto& file : local_files) {
    local_paths.push_back(file.relative_path);
  }
  return compare(local_paths, remote_files, matcher);
}

ComparisonResult FileComparison::compare(
  const std::vector<std::string>& local_paths, const std::vector<std::string>& remote_files,
  const ExclusionPatternMatcher* matcher
) {
  ComparisonResult result;
  result.total_local = local_paths.size();

  std::unordered_set<std::string> local_set;
  for (const auto& path : local_paths) {
    const std::string normalized = normalizePath(path);
    if (!normalized.empty()) {
      local_set.insert(lower(normalized));
    }
  }

  for (const auto& remote : remote_files) {
    const std::string normalized = normalizePath(remote);
    if (normalized.empty()) {
      continue;
    }
    ++result.total_remote;

    if (local_set.count(lower(normalized)) != 0) {
      continue;
    }
    if (matcher != nullptr && matcher->isExcluded(normalized)) {
      result.excluded_files.push_back(normalized);
    } else {
      result.obsolete_files.push_back(normalized);
    }
  }

  return result;
}

std::vector<std::string> FileComparison::identifyEmptyDirectories(
  const std::vector<std::string>& obsolete_files, const std::vector<std::string>& remote_files
) {
  std::unordered_set<std::string> obsolete_set;
  std::set<std::string> candidates;
  for (const auto& file : obsolete_files) {
    const std::string normalized = normalizePath(file);
    if (normalized.empty()) {
      continue;
    }
    obsolete_set.insert(lower(normalized));

    // every ancestor of an obsolete file may end up empty
    auto slash = normalized.rfind('/');
    while (slash != std::string::npos && slash > 0) {
      candidates.insert(normalized.substr(0, slash));
      slash = normalized.rfind('/', slash - 1);
    }
  }

  std::vector<std::string> remote_normalized;
  remote_normalized.reserve(remote_files.size());
  for (const auto& file : remote_files) {
    const std::string normalized = normalizePath(file);
    if (!normalized.empty()) {
      remote_normalized.push_back(lower(normalized));
    }
  }

  std::vector<std::string> empty_dirs;
  for (const auto& dir : candidates) {
    const std::string prefix = lower(dir) + "/";
    const bool all_obsolete = std::all_of(
      remote_normalized.begin(), remote_normalized.end(),
      [&](const std::string& file) {
        return file.compare(0, prefix.size(), prefix) != 0 || obsolete_set.count(file) != 0;
      }
    );
    if (all_obsolete) {
      empty_dirs.push_back(dir);
    }
  }

  std::stable_sort(empty_dirs.begin(), empty_dirs.end(), [](const std::string& a, const std::string& b) {
    return depthOf(a) > depthOf(b);
  });
  return empty_dirs;
}

}  // namespace deploy
}  // namespace ferry
