#include <gtest/gtest.h>
#include <string>

#include "logvec/common/logger.h"

using logvec::common::Logger;

TEST(LoggerTest, ParseKnownLevels) {
    spdlog::level::level_enum level = spdlog::level::info;
    EXPECT_TRUE(Logger::ParseLevel("debug", level));
    EXPECT_EQ(level, spdlog::level::debug);
    EXPECT_TRUE(Logger::ParseLevel("error", level));
    EXPECT_EQ(level, spdlog::level::err);
    EXPECT_TRUE(Logger::ParseLevel("off", level));
    EXPECT_EQ(level, spdlog::level::off);
}

TEST(LoggerTest, UnknownLevelLeavesValueUntouched) {
    spdlog::level::level_enum level = spdlog::level::warn;
    EXPECT_FALSE(Logger::ParseLevel("verbose", level));
    EXPECT_EQ(level, spdlog::level::warn);
}

TEST(LoggerTest, InitTwiceDoesNotThrow) {
    EXPECT_NO_THROW(Logger::Init(true));
    EXPECT_NO_THROW(Logger::Init(true));
    Logger::SetLevel(spdlog::level::warn);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}
