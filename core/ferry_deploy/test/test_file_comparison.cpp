// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for FileComparison
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "exclusion_pattern_matcher.hpp"
#include "file_comparison.hpp"
#include "publish_output_scanner.hpp"

using namespace ferry::deploy;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

TEST(FileComparisonTest, NormalizePath) {
  EXPECT_EQ(FileComparison::normalizePath("/site/bin/app.dll"), "site/bin/app.dll");
  EXPECT_EQ(FileComparison::normalizePath(" bin\\app.dll "), "bin/app.dll");
  EXPECT_EQ(FileComparison::normalizePath("wwwroot/"), "wwwroot");
  EXPECT_EQ(FileComparison::normalizePath("  / "), "");
}

TEST(FileComparisonTest, RemoteOnlyFilesAreObsolete) {
  auto result = FileComparison::compare(
    std::vector<std::string>{"app.dll", "wwwroot/site.css"},
    {"app.dll", "old.dll", "wwwroot/site.css", "wwwroot/old.css"}
  );

  EXPECT_EQ(result.total_local, 2u);
  EXPECT_EQ(result.total_remote, 4u);
  EXPECT_THAT(result.obsolete_files, ElementsAre("old.dll", "wwwroot/old.css"));
  EXPECT_THAT(result.excluded_files, IsEmpty());
}

TEST(FileComparisonTest, MatchingIgnoresCaseAndSeparators) {
  auto result = FileComparison::compare(
    std::vector<std::string>{"wwwroot\\CSS\\Site.css", "App.dll"},
    {"/wwwroot/css/site.css", "app.DLL"}
  );
  EXPECT_EQ(result.obsoleteCount(), 0u);
}

TEST(FileComparisonTest, ExcludedFilesAreReportedSeparately) {
  ExclusionPatternMatcher matcher({"App_Data/**", "*.log"});
  auto result = FileComparison::compare(
    std::vector<std::string>{"app.dll"}, {"app.dll", "App_Data/site.db", "trace.log", "old.dll"},
    &matcher
  );

  EXPECT_THAT(result.obsolete_files, ElementsAre("old.dll"));
  EXPECT_THAT(result.excluded_files, UnorderedElementsAre("App_Data/site.db", "trace.log"));
  EXPECT_EQ(result.excludedCount(), 2u);
}

TEST(FileComparisonTest, MetadataOverloadUsesRelativePaths) {
  FileMetadata dll;
  dll.relative_path = "bin/app.dll";
  FileMetadata css;
  css.relative_path = "wwwroot/site.css";

  auto result = FileComparison::compare(
    std::vector<FileMetadata>{dll, css}, {"bin/app.dll", "bin/old.dll", "wwwroot/site.css"}
  );
  EXPECT_EQ(result.total_local, 2u);
  EXPECT_THAT(result.obsolete_files, ElementsAre("bin/old.dll"));
}

TEST(FileComparisonTest, EmptyLocalMakesEverythingObsolete) {
  auto result = FileComparison::compare(std::vector<std::string>{}, {"a.dll", "b.dll"});
  EXPECT_EQ(result.obsoleteCount(), 2u);
}

// ============================================================================
// Empty directories
// ============================================================================

TEST(FileComparisonTest, DirectoriesLeftEmptyAreDeepestFirst) {
  const std::vector<std::string> remote = {
    "app.dll", "legacy/a.js", "legacy/old/b.js", "legacy/old/c.js", "scripts/keep.js",
    "scripts/drop.js",
  };
  const std::vector<std::string> obsolete = {
    "legacy/a.js", "legacy/old/b.js", "legacy/old/c.js", "scripts/drop.js",
  };

  auto dirs = FileComparison::identifyEmptyDirectories(obsolete, remote);
  EXPECT_THAT(dirs, ElementsAre("legacy/old", "legacy"));
}

TEST(FileComparisonTest, NoEmptyDirectoriesForRootFiles) {
  auto dirs = FileComparison::identifyEmptyDirectories({"old.dll"}, {"old.dll", "app.dll"});
  EXPECT_THAT(dirs, IsEmpty());
}

TEST(FileComparisonTest, DirectoryWithProtectedFileIsKept) {
  const std::vector<std::string> remote = {"uploads/photo.png", "uploads/old.tmp"};
  auto dirs = FileComparison::identifyEmptyDirectories({"uploads/old.tmp"}, remote);
  EXPECT_THAT(dirs, IsEmpty());
}
