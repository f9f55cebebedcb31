// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace DFSM {

/**
 * @brief spdlog-based logger backend
 *
 * Default backend installed by Logger::initialize(). Console output always,
 * plus a dfsm.log file sink when a log directory is given. The initial level
 * can be overridden with the SPDLOG_LEVEL environment variable.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    void applyEnvironmentLevel();
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace DFSM
