// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#include "common/FsmError.h"

namespace DFSM {

const char *errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidConfiguration:
        return "InvalidConfiguration";
    case ErrorCode::MissingInitialState:
        return "MissingInitialState";
    case ErrorCode::UnknownCondition:
        return "UnknownCondition";
    case ErrorCode::UnknownSideEffect:
        return "UnknownSideEffect";
    case ErrorCode::UnknownStateName:
        return "UnknownStateName";
    case ErrorCode::NullContext:
        return "NullContext";
    case ErrorCode::StructuralIntegrity:
        return "StructuralIntegrity";
    case ErrorCode::MalformedDocument:
        return "MalformedDocument";
    default:
        return "Unknown";
    }
}

FsmException::FsmException(ErrorCode code, const std::string &message)
    : std::runtime_error(std::string(errorCodeToString(code)) + ": " + message), code_(code) {}

}  // namespace DFSM
