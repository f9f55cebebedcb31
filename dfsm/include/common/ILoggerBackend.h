// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include <source_location>
#include <string>

namespace DFSM {

/**
 * @brief Log level enumeration
 *
 * Matches spdlog's levels one to one.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Logger backend interface for dependency injection
 *
 * Applications embedding DFSM implement this interface to route engine
 * diagnostics (transition traces, name-resolution warnings) into their own
 * logging system.
 *
 * @code
 * class AppLogger : public DFSM::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         appLog->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { appLog->setMinLevel(level); }
 *     void flush() override { appLog->flush(); }
 * };
 *
 * DFSM::Logger::setBackend(std::make_unique<AppLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location of the log statement
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     *
     * Messages below this level are dropped.
     */
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace DFSM
