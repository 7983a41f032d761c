#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace fstore::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path log_dir;
  std::filesystem::path log_file;

  void SetUp() override {
    log_dir = unique_temp_dir("logger_test_");
    std::filesystem::create_directories(log_dir);
    log_file = log_dir / "test.log";
    init_logging(log_file.string(), severity_level::trace);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    enable_logging();
    std::filesystem::remove_all(log_dir);
  }

  bool log_contains(const std::string& text) {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::binary);
    if (!file) {
      return false;
    }
    std::stringstream content;
    content << file.rdbuf();
    return content.str().find(text) != std::string::npos;
  }
};

TEST_F(LoggerTest, BasicLogging) {
  LOG_INFO << "Test info message";
  LOG_ERROR << "Test error message";

  EXPECT_TRUE(log_contains("Test info message"));
  EXPECT_TRUE(log_contains("Test error message"));
}

TEST_F(LoggerTest, TrivialLoggerSharesSink) {
  BOOST_LOG_TRIVIAL(warning) << "Trivial record";
  EXPECT_TRUE(log_contains("Trivial record"));
  EXPECT_TRUE(log_contains("[warning]"));
}

TEST_F(LoggerTest, ThreadLogging) {
  std::thread t([]() {
    LOG_INFO << "Message from thread";
  });
  t.join();

  EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, SeverityLevels) {
  LOG_TRACE << "Trace message";
  LOG_DEBUG << "Debug message";
  LOG_INFO << "Info message";
  LOG_WARN << "Warning message";
  LOG_ERROR << "Error message";
  LOG_FATAL << "Fatal message";

  EXPECT_TRUE(log_contains("Trace message"));
  EXPECT_TRUE(log_contains("Debug message"));
  EXPECT_TRUE(log_contains("Info message"));
  EXPECT_TRUE(log_contains("Warning message"));
  EXPECT_TRUE(log_contains("Error message"));
  EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(severity_level::warning);

  LOG_DEBUG << "Should not appear";
  LOG_WARN << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear"));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
  disable_logging();
  LOG_INFO << "Hidden while disabled";

  enable_logging();
  LOG_INFO << "Visible after enable";

  EXPECT_FALSE(log_contains("Hidden while disabled"));
  EXPECT_TRUE(log_contains("Visible after enable"));
}

TEST(SeverityParseTest, ParsesKnownNames) {
  severity_level level = severity_level::info;
  EXPECT_TRUE(parse_severity("debug", level));
  EXPECT_EQ(level, severity_level::debug);
  EXPECT_TRUE(parse_severity("fatal", level));
  EXPECT_EQ(level, severity_level::fatal);
  EXPECT_FALSE(parse_severity("loud", level));
}
