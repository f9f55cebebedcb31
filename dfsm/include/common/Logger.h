// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace DFSM {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Two usage patterns:
 *
 * 1. Default mode: the spdlog backend is created lazily on first use
 * 2. Custom mode: callers inject their own ILoggerBackend implementation
 *
 * @code
 * DFSM::Logger::initialize("logs", true);
 * LOG_INFO("Loaded definition '{}'", label);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * Replaces the current backend. Ownership is transferred.
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     *
     * No-op if a backend is already installed.
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for dfsm.log
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace DFSM

// Formatting uses the fmt library bundled with spdlog
#define LOG_TRACE(...) DFSM::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) DFSM::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) DFSM::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) DFSM::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) DFSM::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
