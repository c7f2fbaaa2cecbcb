#include <gtest/gtest.h>
#include <cstdlib>

#include "multibench/logger.hpp"

using namespace multibench;

TEST(LoggerTest, LevelComesFromEnvironment) {
    ::setenv("MBENCH_LOG_LEVEL", "Debug", 1);
    EXPECT_EQ(Logger::parseEnvLevel(), LogLevel::DEBUG);
    ::setenv("MBENCH_LOG_LEVEL", "warning", 1);
    EXPECT_EQ(Logger::parseEnvLevel(), LogLevel::WARN);
    ::setenv("MBENCH_LOG_LEVEL", "chatty", 1);
    EXPECT_EQ(Logger::parseEnvLevel(), LogLevel::INFO);
    ::unsetenv("MBENCH_LOG_LEVEL");
    EXPECT_EQ(Logger::parseEnvLevel(), LogLevel::INFO);
}

TEST(LoggerTest, EnabledFollowsThreshold) {
    LogLevel saved = Logger::level();
    Logger::setLevel(LogLevel::WARN);
    EXPECT_TRUE(Logger::enabled(LogLevel::ERROR));
    EXPECT_TRUE(Logger::enabled(LogLevel::WARN));
    EXPECT_FALSE(Logger::enabled(LogLevel::INFO));
    LOG_DEBUG("suppressed");
    Logger::setLevel(saved);
}
