// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_file_sink.cpp
 * @brief Unit tests for the rotating file sink
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "ferry_file_sink.hpp"
#include "ferry_log_init.hpp"
#define FERRY_LOG_COMPONENT "file_sink_test"
#include "ferry_log_macros.hpp"

namespace fs = std::filesystem;

using namespace ferry::logging;

TEST(EscapeJsonTest, EscapesQuotesAndControlCharacters) {
  EXPECT_EQ(escape_json("plain"), "plain");
  EXPECT_EQ(escape_json("a\"b"), "a\\\"b");
  EXPECT_EQ(escape_json("a\\b"), "a\\\\b");
  EXPECT_EQ(escape_json("line\nbreak\t"), "line\\nbreak\\t");
  EXPECT_EQ(escape_json(std::string("\x01", 1)), "\\u0001");
}

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    log_dir_ = fs::temp_directory_path() /
               ("ferry_log_test_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    std::error_code ec;
    fs::remove_all(log_dir_, ec);
  }

  std::string readAllLogs() const {
    std::ostringstream content;
    for (const auto& entry : fs::directory_iterator(log_dir_)) {
      std::ifstream in(entry.path());
      content << in.rdbuf();
    }
    return content.str();
  }

  fs::path log_dir_;
};

TEST_F(FileSinkTest, WritesJsonRecordsWithBucketContext) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_config.directory = log_dir_.string();
  config.file_config.format_json = true;
  config.tool_name = "ferry_migrate";
  config.run_id = "run-42";
  init_logging(config);

  {
    FERRY_LOG_SCOPED_CONTEXT("photos", "2024/cat.jpg");
    FERRY_LOG_INFO("Transferred object" << kv("parts", 2));
  }
  shutdown_logging();

  ASSERT_TRUE(fs::exists(log_dir_));
  std::string logs = readAllLogs();
  EXPECT_NE(logs.find("\"level\":\"INFO\""), std::string::npos);
  EXPECT_NE(logs.find("\"component\":\"file_sink_test\""), std::string::npos);
  EXPECT_NE(logs.find("\"msg\":\"Transferred object parts=2\""), std::string::npos);
  EXPECT_NE(logs.find("\"bucket\":\"photos\""), std::string::npos);
  EXPECT_NE(logs.find("\"key\":\"2024/cat.jpg\""), std::string::npos);
  EXPECT_NE(logs.find("\"tool\":\"ferry_migrate\""), std::string::npos);
  EXPECT_NE(logs.find("\"run\":\"run-42\""), std::string::npos);
}

TEST_F(FileSinkTest, FileNameStartsWithToolName) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.tool_name = "ferry_sweep";
  config.file_config.directory = log_dir_.string();
  init_logging(config);
  FERRY_LOG_INFO("sweep started");
  shutdown_logging();

  bool found = false;
  for (const auto& entry : fs::directory_iterator(log_dir_)) {
    if (entry.path().filename().string().rfind("ferry_sweep_", 0) == 0) {
      found = true;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(FileSinkTest, ContextOutsideScopeIsNotAttached) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_config.directory = log_dir_.string();
  config.file_config.format_json = false;
  init_logging(config);

  {
    FERRY_LOG_SCOPED_CONTEXT("photos", "a.jpg");
    FERRY_LOG_INFO("inside");
  }
  FERRY_LOG_INFO("outside");
  shutdown_logging();

  std::string logs = readAllLogs();
  EXPECT_NE(logs.find("inside | bucket=photos key=a.jpg"), std::string::npos);
  EXPECT_NE(logs.find("outside\n"), std::string::npos);
  EXPECT_EQ(logs.find("outside |"), std::string::npos);
}

TEST(FilePatternTest, DerivedFromToolUnlessSet) {
  FileSinkConfig config;
  EXPECT_EQ(resolve_file_pattern(config, "ferry_migrate"), "ferry_migrate_%Y%m%d_%H%M%S_%N.log");
  EXPECT_EQ(resolve_file_pattern(config, ""), "ferry_%Y%m%d_%H%M%S_%N.log");
  config.file_pattern = "custom_%N.log";
  EXPECT_EQ(resolve_file_pattern(config, "ferry_migrate"), "custom_%N.log");
}

TEST_F(FileSinkTest, SeverityFilterDropsLowerLevels) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_level = severity_level::warn;
  config.file_config.directory = log_dir_.string();
  config.file_config.format_json = false;
  init_logging(config);

  FERRY_LOG_INFO("below threshold");
  FERRY_LOG_WARN("above threshold");
  shutdown_logging();

  std::string logs = readAllLogs();
  EXPECT_EQ(logs.find("below threshold"), std::string::npos);
  EXPECT_NE(logs.find("[WARN] [file_sink_test] above threshold"), std::string::npos);
}
