#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <xrayopt_core/logging.hpp>

using namespace xrayopt;

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    previous_level_ = Logger::level();
    Logger::set_sink([this](LogLevel level, std::string_view message) {
      captured_.emplace_back(level, std::string(message));
    });
  }

  void TearDown() override {
    Logger::set_sink({});
    Logger::set_level(previous_level_);
  }

  std::vector<std::pair<LogLevel, std::string>> captured_;
  LogLevel previous_level_ = LogLevel::Warning;
};

TEST_F(LoggerTest, LevelFiltersMessages) {
  Logger::set_level(LogLevel::Warning);

  Logger::error("e");
  Logger::warn("w");
  Logger::info("i");
  Logger::debug("d");

  ASSERT_EQ(captured_.size(), 2u);
  EXPECT_EQ(captured_[0].first, LogLevel::Error);
  EXPECT_EQ(captured_[0].second, "e");
  EXPECT_EQ(captured_[1].first, LogLevel::Warning);
}

TEST_F(LoggerTest, DebugLevelPassesEverything) {
  Logger::set_level(LogLevel::Debug);

  Logger::error("e");
  Logger::warn("w");
  Logger::info("i");
  Logger::debug("d");

  EXPECT_EQ(captured_.size(), 4u);
}

TEST_F(LoggerTest, QuietSilencesAll) {
  Logger::set_level(LogLevel::Quiet);

  Logger::error("e");
  Logger::log(LogLevel::Quiet, "q");

  EXPECT_TRUE(captured_.empty());
}

TEST_F(LoggerTest, LevelNames) {
  EXPECT_EQ(to_string(LogLevel::Error), "ERROR");
  EXPECT_EQ(to_string(LogLevel::Warning), "WARN");
  EXPECT_EQ(to_string(LogLevel::Info), "INFO");
  EXPECT_EQ(to_string(LogLevel::Debug), "DEBUG");
}
