// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace DFSM {
namespace Log {

// Longest untrusted name echoed into a log line
constexpr std::size_t MAX_SANITIZED_LENGTH = 128;

/**
 * @brief Make a name read from a persisted definition safe to log
 *
 * CR/LF are written as visible escapes and other non-printable bytes as '?',
 * so a crafted state or condition name cannot forge extra log lines. Input
 * longer than MAX_SANITIZED_LENGTH is cut and marked with "...".
 */
inline std::string sanitize(std::string_view input) {
    bool truncated = input.size() > MAX_SANITIZED_LENGTH;
    std::string_view visible = truncated ? input.substr(0, MAX_SANITIZED_LENGTH) : input;

    std::string out;
    out.reserve(visible.size() + 3);
    for (char c : visible) {
        switch (c) {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            out += (c >= 32 && c < 127) ? c : '?';
            break;
        }
    }

    if (truncated) {
        out += "...";
    }
    return out;
}

}  // namespace Log
}  // namespace DFSM
