// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_EXCLUSION_PATTERN_MATCHER_HPP
#define FERRY_EXCLUSION_PATTERN_MATCHER_HPP

#include <regex>
#include <string>
#include <vector>

namespace ferry {
namespace deploy {

/**
 * Case-insensitive glob matching on relative paths.
 *
 * Supported syntax:
 *   *    any run of characters except '/'
 *   ?    one character except '/'
 *   **   any run of characters including '/'
 *   ** / (without the space) zero or more leading directories
 *
 * Patterns are anchored at both ends. Backslashes in patterns and paths are
 * treated as '/'.
 */
class ExclusionPatternMatcher {
public:
  /**
   * Matcher over defaultPatterns().
   */
  ExclusionPatternMatcher();

  /**
   * @throws std::invalid_argument if a pattern is blank
   */
  explicit ExclusionPatternMatcher(const std::vector<std::string>& patterns);

  static const std::vector<std::string>& defaultPatterns();

  /**
   * Defaults followed by extra_patterns.
   */
  static ExclusionPatternMatcher createWithDefaults(
    const std::vector<std::string>& extra_patterns = {}
  );

  static bool isValidPattern(const std::string& pattern);

  /**
   * Blank paths are never excluded.
   */
  bool isExcluded(const std::string& relative_path) const;

  std::vector<std::string> filterExcluded(const std::vector<std::string>& paths) const;

  /**
   * @throws std::invalid_argument if pattern is blank
   */
  void addPattern(const std::string& pattern);

  const std::vector<std::string>& patterns() const { return patterns_; }

private:
  static std::regex compile(const std::string& glob);

  std::vector<std::string> patterns_;
  std::vector<std::regex> compiled_;
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_EXCLUSION_PATTERN_MATCHER_HPP
