/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace multibench {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Reads MBENCH_LOG_LEVEL; INFO when unset or unrecognized.
    [[nodiscard]] static LogLevel parseEnvLevel() noexcept;

private:
    static const char* levelToString(LogLevel level) noexcept;
};

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::multibench::Logger::error(msg)
#define LOG_WARN(msg)  ::multibench::Logger::warn(msg)
#define LOG_INFO(msg)  ::multibench::Logger::info(msg)
#define LOG_DEBUG(msg) ::multibench::Logger::debug(msg)
#define LOG_TRACE(msg) ::multibench::Logger::trace(msg)
