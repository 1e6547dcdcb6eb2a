#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <thread>
#include <filesystem>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace cloudsync::logging;

class LoggerTest : public ::testing::Test {
protected:
  cloudsync::test::TempDir dir{"logger_test"};
  std::filesystem::path log_file = dir / "test.log";

  void SetUp() override {
    init_logging(log_file.string(), boost::log::trivial::trace);
  }

  void TearDown() override {
    // Ensure all logs are written
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    enable_logging();
  }

  bool log_contains(const std::string& text, int max_retries = 3) {
    for (int retry = 0; retry < max_retries; ++retry) {
      // Force flush and wait with backoff
      boost::log::core::get()->flush();
      std::this_thread::sleep_for(std::chrono::milliseconds(20 * (retry + 1)));

      std::ifstream file(log_file, std::ios::in | std::ios::binary);
      if (!file.is_open()) {
        continue;
      }
      std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
      if (content.find(text) != std::string::npos) {
        return true;
      }
    }
    return false;
  }
};

TEST_F(LoggerTest, BasicLogging) {
  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  EXPECT_TRUE(log_contains("Test info message"));
  EXPECT_TRUE(log_contains("Test error message"));
  EXPECT_TRUE(log_contains("Logger: Logging system initialized"));
}

TEST_F(LoggerTest, ThreadLogging) {
  std::thread t([]() {
    BOOST_LOG_TRIVIAL(info) << "Message from thread";
  });
  t.join();

  EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, SeverityLevels) {
  BOOST_LOG_TRIVIAL(trace) << "Trace message";
  BOOST_LOG_TRIVIAL(debug) << "Debug message";
  BOOST_LOG_TRIVIAL(info) << "Info message";
  BOOST_LOG_TRIVIAL(warning) << "Warning message";
  BOOST_LOG_TRIVIAL(error) << "Error message";
  BOOST_LOG_TRIVIAL(fatal) << "Fatal message";

  EXPECT_TRUE(log_contains("Trace message"));
  EXPECT_TRUE(log_contains("Debug message"));
  EXPECT_TRUE(log_contains("Info message"));
  EXPECT_TRUE(log_contains("Warning message"));
  EXPECT_TRUE(log_contains("Error message"));
  EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, ReinitializingReplacesTheSink) {
  std::filesystem::path other = dir / "other.log";
  init_logging(other.string(), boost::log::trivial::info);
  BOOST_LOG_TRIVIAL(warning) << "Scheduler: after reinit";

  boost::log::core::get()->flush();
  std::ifstream file(other, std::ios::in | std::ios::binary);
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("Scheduler: after reinit"), std::string::npos);
  EXPECT_FALSE(log_contains("Scheduler: after reinit", 1));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(boost::log::trivial::warning);

  BOOST_LOG_TRIVIAL(debug) << "Should not appear";
  BOOST_LOG_TRIVIAL(info) << "Also should not appear";
  BOOST_LOG_TRIVIAL(warning) << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear", 1));
  EXPECT_FALSE(log_contains("Also should not appear", 1));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
  disable_logging();
  BOOST_LOG_TRIVIAL(info) << "Should not appear";

  enable_logging();
  BOOST_LOG_TRIVIAL(info) << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear", 1));
  EXPECT_TRUE(log_contains("Should appear"));
}
