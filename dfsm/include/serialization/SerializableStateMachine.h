// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace DFSM {

/**
 * @brief Name-only transition for persistence
 *
 * Guards and side effects are referenced by their registry names; an absent
 * name means "always eligible" / "no side effect".
 */
struct SerializableTransition {
    std::string from;
    std::string to;
    std::optional<std::string> conditionName;
    std::optional<std::string> sideEffectName;

    bool operator==(const SerializableTransition &other) const = default;
};

/**
 * @brief Registry-independent mirror of a StateMachineDefinition
 *
 * Plain data, encoding-agnostic. State names are the canonical names from
 * StateTraits; list order is preserved through encode/decode.
 */
struct SerializableStateMachine {
    std::string entityLabel;
    std::string initialState;
    std::vector<std::string> states;
    std::vector<SerializableTransition> transitions;

    bool operator==(const SerializableStateMachine &other) const = default;
};

}  // namespace DFSM
