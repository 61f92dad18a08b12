// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "exclusion_pattern_matcher.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>
#include <stdexcept>

namespace ferry {
namespace deploy {

namespace {

bool isBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string toForwardSlashes(std::string path) {
  std::replace(path.begin(), path.end(), '\\', '/');
  return path;
}

std::string globToRegex(const std::string& glob) {
  static const char* kRegexSpecials = ".^$|()[]{}+\\";

  std::string regex = "^";
  for (size_t i = 0; i < glob.size(); ++i) {
    const char c = glob[i];
    if (c == '*') {
      if (i + 1 < glob.size() && glob[i + 1] == '*') {
        if (i + 2 < glob.size() && glob[i + 2] == '/') {
          regex += "(.*/)?";
          i += 2;
        } else {
          regex += ".*";
          i += 1;
        }
      } else {
        regex += "[^/]*";
      }
    } else if (c == '?') {
      regex += "[^/]";
    } else if (std::strchr(kRegexSpecials, c) != nullptr) {
      regex += '\\';
      regex += c;
    } else {
      regex += c;
    }
  }
  regex += "$";
  return regex;
}

}  // namespace

const std::vector<std::string>& ExclusionPatternMatcher::defaultPatterns() {
  static const std::vector<std::string> patterns = {
    "App_Data/**", "uploads/**",      "logs/**",            "*.log",      ".git/**",
    ".vs/**",      "node_modules/**", "appsettings.*.json", "web.config",
  };
  return patterns;
}

ExclusionPatternMatcher::ExclusionPatternMatcher()
    : ExclusionPatternMatcher(defaultPatterns()) {}

ExclusionPatternMatcher::ExclusionPatternMatcher(const std::vector<std::string>& patterns) {
  for (const auto& pattern : patterns) {
    addPattern(pattern);
  }
}

ExclusionPatternMatcher ExclusionPatternMatcher::createWithDefaults(
  const std::vector<std::string>& extra_patterns
) {
  std::vector<std::string> all = defaultPatterns();
  all.insert(all.end(), extra_patterns.begin(), extra_patterns.end());
  return ExclusionPatternMatcher(all);
}

std::regex ExclusionPatternMatcher::compile(const std::string& glob) {
  if (isBlank(glob)) {
    throw std::invalid_argument("Glob pattern cannot be empty or whitespace.");
  }
  return std::regex(
    globToRegex(toForwardSlashes(glob)), std::regex::ECMAScript | std::regex::icase
  );
}

bool ExclusionPatternMatcher::isValidPattern(const std::string& pattern) {
  try {
    compile(pattern);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::regex_error&) {
    return false;
  }
}

void ExclusionPatternMatcher::addPattern(const std::string& pattern) {
  compiled_.push_back(compile(pattern));
  patterns_.push_back(pattern);
}

bool ExclusionPatternMatcher::isExcluded(const std::string& relative_path) const {
  if (isBlank(relative_path)) {
    return false;
  }
  const std::string normalized = toForwardSlashes(relative_path);
  return std::any_of(compiled_.begin(), compiled_.end(), [&](const std::regex& regex) {
    return std::regex_match(normalized, regex);
  });
}

std::vector<std::string> ExclusionPatternMatcher::filterExcluded(
  const std::vector<std::string>& paths
) const {
  std::vector<std::string> kept;
  std::copy_if(paths.begin(), paths.end(), std::back_inserter(kept), [this](const std::string& p) {
    return !isExcluded(p);
  });
  return kept;
}

}  // namespace deploy
}  // namespace ferry
