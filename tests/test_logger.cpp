/**
 * @file test_logger.cpp
 * @brief Unit tests for the spdlog setup helper
 */

#include <gtest/gtest.h>
#include <brdocs/logging/logger.h>

using namespace brdocs;

TEST(LoggerTest, ParseLevel_KnownNames) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("critical"), spdlog::level::critical);
    EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
}

TEST(LoggerTest, ParseLevel_UnknownIsInfo) {
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel(""), spdlog::level::info);
}

TEST(LoggerTest, Initialize_InstallsDefaultLogger) {
    Logger::initialize("brdocs-test", "error");
    EXPECT_EQ(spdlog::default_logger()->name(), "brdocs-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);

    Logger::setLevel("debug");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);

    Logger::setLevel("info");
    Logger::flush();
}
