// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include <stdexcept>
#include <string>

namespace DFSM {

/**
 * @brief Failure categories raised by the engine
 *
 * All of them are fatal to the operation that raised them. Unresolved
 * guard/side-effect names during a lenient load are not errors and never
 * produce one of these codes.
 */
enum class ErrorCode {
    InvalidConfiguration,  // Builder or machine misuse (absent registry, null definition, unnamed state)
    MissingInitialState,   // build()/toSerializable() before withInitialState()
    UnknownCondition,      // Condition name not present in the registry
    UnknownSideEffect,     // Side effect name not present in the registry
    UnknownStateName,      // Persisted state name does not map to an enumerator
    NullContext,           // Transition evaluated without a context
    StructuralIntegrity,   // Definition references a state outside its state set
    MalformedDocument      // Encoded definition cannot be decoded
};

/**
 * @brief Return the enumerator name of an error code
 */
const char *errorCodeToString(ErrorCode code);

/**
 * @brief Exception carrying an ErrorCode
 *
 * what() is prefixed with the code name, e.g. "UnknownCondition: Condition 'Paid' not found in registry".
 */
class FsmException : public std::runtime_error {
public:
    FsmException(ErrorCode code, const std::string &message);

    ErrorCode code() const noexcept {
        return code_;
    }

private:
    ErrorCode code_;
};

}  // namespace DFSM
