#include <gtest/gtest.h>

#include "vimeo/logging.hpp"

using vimeo::LogLevel;
using vimeo::parse_log_level;

TEST(LoggingTest, ParsesLevelsCaseInsensitively) {
  EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
  EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
  EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
  EXPECT_EQ(parse_log_level("off", LogLevel::Info), LogLevel::Off);
}

TEST(LoggingTest, UnknownLevelUsesFallback) {
  EXPECT_EQ(parse_log_level("verbose"), LogLevel::Off);
  EXPECT_EQ(parse_log_level("verbose", LogLevel::Warn), LogLevel::Warn);
}

TEST(LoggingTest, LevelNamesRoundTrip) {
  for (auto level : {LogLevel::Off, LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug}) {
    EXPECT_EQ(parse_log_level(vimeo::to_string(level), LogLevel::Debug), level);
  }
}
