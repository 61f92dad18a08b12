// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_log_init.cpp
 * @brief Severity parsing, environment overrides and sink lifecycle
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>

#include "ferry_log_init.hpp"
#include "ferry_log_macros.hpp"
#include "ferry_log_severity.hpp"

using namespace ferry::logging;

// ============================================================================
// Severity Level Tests
// ============================================================================

TEST(SeverityLevelTest, ParseNamesIgnoringCase) {
  EXPECT_EQ(parse_severity_level("debug"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("INFO"), severity_level::info);
  EXPECT_EQ(parse_severity_level("Warn"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("warning"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("ERROR"), severity_level::error);
  EXPECT_EQ(parse_severity_level("fatal"), severity_level::fatal);
}

TEST(SeverityLevelTest, RejectsUnknownNames) {
  EXPECT_FALSE(parse_severity_level("").has_value());
  EXPECT_FALSE(parse_severity_level("verbose").has_value());
  EXPECT_FALSE(parse_severity_level("info ").has_value());
}

TEST(SeverityLevelTest, StreamsUppercaseName) {
  std::ostringstream oss;
  oss << severity_level::warn << "|" << severity_level::fatal;
  EXPECT_EQ(oss.str(), "WARN|FATAL");
}

TEST(SeverityLevelTest, KeyValueQuotesStrings) {
  EXPECT_EQ(kv("count", 3), " count=3");
  EXPECT_EQ(kv("host", std::string("example.org")), " host=\"example.org\"");
  EXPECT_EQ(kv("path", "/srv/www"), " path=\"/srv/www\"");
}

// ============================================================================
// Environment Override Tests
// ============================================================================

class LoggingConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear_env(); }
  void TearDown() override { clear_env(); }

  static void clear_env() {
    unsetenv("FERRY_LOG_LEVEL");
    unsetenv("FERRY_LOG_CONSOLE_LEVEL");
    unsetenv("FERRY_LOG_FILE_LEVEL");
    unsetenv("FERRY_LOG_FILE_DIR");
    unsetenv("FERRY_LOG_FORMAT");
    unsetenv("FERRY_LOG_FILE_ENABLED");
    unsetenv("FERRY_LOG_CONSOLE_ENABLED");
  }
};

TEST_F(LoggingConfigTest, Defaults) {
  LoggingConfig config;
  EXPECT_TRUE(config.console_enabled);
  EXPECT_TRUE(config.console_colors);
  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_FALSE(config.file_enabled);
  EXPECT_EQ(config.file_level, severity_level::debug);
  EXPECT_EQ(config.file_config.directory, "/var/log/ferry");
  EXPECT_FALSE(config.file_config.format_json);
}

TEST_F(LoggingConfigTest, GlobalLevelAppliesToBothSinks) {
  LoggingConfig config;
  setenv("FERRY_LOG_LEVEL", "error", 1);
  apply_env_overrides(config);
  EXPECT_EQ(config.console_level, severity_level::error);
  EXPECT_EQ(config.file_level, severity_level::error);
}

TEST_F(LoggingConfigTest, SinkLevelWinsOverGlobalLevel) {
  LoggingConfig config;
  setenv("FERRY_LOG_LEVEL", "error", 1);
  setenv("FERRY_LOG_CONSOLE_LEVEL", "debug", 1);
  apply_env_overrides(config);
  EXPECT_EQ(config.console_level, severity_level::debug);
  EXPECT_EQ(config.file_level, severity_level::error);
}

TEST_F(LoggingConfigTest, FileSettingsFromEnvironment) {
  LoggingConfig config;
  setenv("FERRY_LOG_FILE_ENABLED", "yes", 1);
  setenv("FERRY_LOG_FILE_DIR", "/tmp/ferry-logs", 1);
  setenv("FERRY_LOG_FORMAT", "JSON", 1);
  apply_env_overrides(config);
  EXPECT_TRUE(config.file_enabled);
  EXPECT_EQ(config.file_config.directory, "/tmp/ferry-logs");
  EXPECT_TRUE(config.file_config.format_json);
}

TEST_F(LoggingConfigTest, InvalidValuesKeepCurrentSettings) {
  LoggingConfig config;
  config.console_enabled = false;
  setenv("FERRY_LOG_CONSOLE_ENABLED", "maybe", 1);
  setenv("FERRY_LOG_FILE_LEVEL", "loud", 1);
  apply_env_overrides(config);
  EXPECT_FALSE(config.console_enabled);
  EXPECT_EQ(config.file_level, severity_level::debug);
}

TEST_F(LoggingConfigTest, EmptyVariableIsIgnored) {
  LoggingConfig config;
  setenv("FERRY_LOG_CONSOLE_LEVEL", "", 1);
  apply_env_overrides(config);
  EXPECT_EQ(config.console_level, severity_level::info);
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

class LoggingInitTest : public ::testing::Test {
protected:
  void SetUp() override { shutdown_logging(); }
  void TearDown() override { shutdown_logging(); }
};

TEST_F(LoggingInitTest, InitAndShutdown) {
  EXPECT_FALSE(is_logging_initialized());
  init_logging_default();
  EXPECT_TRUE(is_logging_initialized());
  FERRY_LOG_INFO("lifecycle" << kv("step", 1));
  shutdown_logging();
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LoggingInitTest, SecondInitIsIgnored) {
  LoggingConfig config;
  config.console_colors = false;
  init_logging(config);
  init_logging(config);
  EXPECT_TRUE(is_logging_initialized());
}

TEST_F(LoggingInitTest, ShutdownAndFlushWithoutInit) {
  EXPECT_NO_THROW(flush_logging());
  EXPECT_NO_THROW(shutdown_logging());
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LoggingInitTest, ReconfigureKeepsLoggingUp) {
  init_logging_default();
  LoggingConfig config;
  config.console_level = severity_level::warn;
  reconfigure_logging(config);
  EXPECT_TRUE(is_logging_initialized());
  FERRY_LOG_WARN("after reconfigure");
}

TEST_F(LoggingInitTest, AddAndRemoveExtraSink) {
  std::ostringstream captured;
  auto sink = create_console_sink(severity_level::debug, false, &captured);
  add_sink(sink);
  FERRY_LOG_ERROR("extra sink");
  sink->flush();
  remove_sink(sink);
  sink->stop();
  EXPECT_NE(captured.str().find("[ferry] extra sink"), std::string::npos);
}
