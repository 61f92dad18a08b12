// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_sinks.cpp
 * @brief Console and file sink formatting
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#define FERRY_LOG_COMPONENT "sink_test"
#include "ferry_log_init.hpp"
#include "ferry_log_macros.hpp"

namespace fs = std::filesystem;

using namespace ferry::logging;

namespace {

std::vector<std::string> read_all_lines(const fs::path& dir) {
  std::vector<std::string> lines;
  for (const auto& entry : fs::directory_iterator(dir)) {
    std::ifstream in(entry.path());
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty()) {
        lines.push_back(line);
      }
    }
  }
  return lines;
}

}  // namespace

// ============================================================================
// Console Sink Tests
// ============================================================================

class ConsoleSinkTest : public ::testing::Test {
protected:
  void SetUp() override { shutdown_logging(); }

  std::string capture(bool use_colors, severity_level min_level) {
    std::ostringstream out;
    auto sink = create_console_sink(min_level, use_colors, &out);
    add_sink(sink);
    FERRY_LOG_INFO("info record");
    FERRY_LOG_ERROR("error record");
    sink->flush();
    remove_sink(sink);
    sink->stop();
    return out.str();
  }
};

TEST_F(ConsoleSinkTest, PlainFormatHasSeverityAndComponent) {
  const std::string text = capture(false, severity_level::info);
  EXPECT_NE(text.find("[INFO] [sink_test] info record"), std::string::npos);
  EXPECT_NE(text.find("[ERROR] [sink_test] error record"), std::string::npos);
  EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST_F(ConsoleSinkTest, ColoredFormatWrapsSeverity) {
  const std::string text = capture(true, severity_level::info);
  EXPECT_NE(text.find(std::string(get_color(severity_level::error)) + "[ERROR]"),
            std::string::npos);
}

TEST_F(ConsoleSinkTest, FilterDropsLowerLevels) {
  const std::string text = capture(false, severity_level::error);
  EXPECT_EQ(text.find("info record"), std::string::npos);
  EXPECT_NE(text.find("error record"), std::string::npos);
}

TEST_F(ConsoleSinkTest, ScopedContextIsAppended) {
  std::ostringstream out;
  auto sink = create_console_sink(severity_level::debug, false, &out);
  add_sink(sink);
  {
    FERRY_LOG_SCOPED_CONTEXT("abc123", "production");
    FERRY_LOG_INFO("with context");
  }
  FERRY_LOG_INFO("without context");
  sink->flush();
  remove_sink(sink);
  sink->stop();

  std::istringstream lines(out.str());
  std::string first, second;
  std::getline(lines, first);
  std::getline(lines, second);
  EXPECT_NE(first.find("| profile=production deployment=abc123"), std::string::npos);
  EXPECT_EQ(second.find("profile="), std::string::npos);
}

// ============================================================================
// File Sink Tests
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    shutdown_logging();
    test_dir_ = fs::temp_directory_path() /
                ("ferry_file_sink_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    shutdown_logging();
    fs::remove_all(test_dir_);
  }

  LoggingConfig file_only(bool json) const {
    LoggingConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.file_config.directory = test_dir_.string();
    config.file_config.file_pattern = "ferry_test_%N.log";
    config.file_config.format_json = json;
    return config;
  }

  fs::path test_dir_;
};

TEST_F(FileSinkTest, JsonLinesAreParseable) {
  init_logging(file_only(true));
  FERRY_LOG_WARN("quote \" and\nnewline");
  shutdown_logging();

  auto lines = read_all_lines(test_dir_);
  ASSERT_EQ(lines.size(), 1u);
  auto record = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(record["level"], "WARN");
  EXPECT_EQ(record["msg"], "[sink_test] quote \" and\nnewline");
  EXPECT_TRUE(record.contains("ts"));
  EXPECT_TRUE(record.contains("thread_id"));
}

TEST_F(FileSinkTest, TextLinesCarryLevel) {
  init_logging(file_only(false));
  FERRY_LOG_INFO("plain text");
  shutdown_logging();

  auto lines = read_all_lines(test_dir_);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("[INFO] [sink_test] plain text"), std::string::npos);
}

TEST_F(FileSinkTest, CreatesMissingDirectory) {
  FileSinkConfig config;
  config.directory = (test_dir_ / "nested" / "logs").string();
  auto sink = create_file_sink(config, severity_level::info);
  ASSERT_NE(sink, nullptr);
  EXPECT_TRUE(fs::exists(test_dir_ / "nested" / "logs"));
}
