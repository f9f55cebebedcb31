// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"
#include <cctype>
#include <mutex>

namespace DFSM {

std::unique_ptr<ILoggerBackend> Logger::backend_;

// Guards backend installation; the backends themselves are thread-safe
static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t nameEnd = parenPos;
    while (nameEnd > 0 && std::isspace(static_cast<unsigned char>(fullName[nameEnd - 1]))) {
        nameEnd--;
    }

    // Last space outside template arguments separates the return type
    size_t nameStart = 0;
    int angleDepth = 0;
    for (size_t i = 0; i < nameEnd; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == ' ' && angleDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string qualified = fullName.substr(nameStart, nameEnd - nameStart);
    while (!qualified.empty() && (qualified[0] == '*' || qualified[0] == '&')) {
        qualified.erase(0, 1);
    }

    // Strip template arguments: DFSM::FiniteStateMachine<A, B>::tryTransitionTo -> DFSM::FiniteStateMachine::tryTransitionTo
    std::string result;
    angleDepth = 0;
    for (char c : qualified) {
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (angleDepth == 0) {
            result += c;
        }
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace DFSM
