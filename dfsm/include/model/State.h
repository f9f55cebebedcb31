// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "common/FsmError.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace DFSM {

/**
 * @brief Canonical names of an enumerated state type
 *
 * Specialize once per state enum. The name is the enumerator's declared
 * identifier and is what persisted definitions store.
 *
 * @code
 * enum class TicketState { Open, InProgress, Resolved };
 *
 * namespace DFSM {
 * template <> struct StateTraits<TicketState> {
 *     static constexpr std::array<std::pair<TicketState, std::string_view>, 3> names{{
 *         {TicketState::Open, "Open"},
 *         {TicketState::InProgress, "InProgress"},
 *         {TicketState::Resolved, "Resolved"},
 *     }};
 * };
 * }  // namespace DFSM
 * @endcode
 */
template <typename TState> struct StateTraits;

/**
 * @brief Canonical name of a state value
 * @throws FsmException InvalidConfiguration if the value has no entry in StateTraits
 */
template <typename TState> std::string stateName(TState value) {
    static_assert(std::is_enum_v<TState>, "DFSM state types must be enumerations");

    for (const auto &entry : StateTraits<TState>::names) {
        if (entry.first == value) {
            return std::string(entry.second);
        }
    }
    throw FsmException(ErrorCode::InvalidConfiguration,
                       "State value " +
                           std::to_string(static_cast<long long>(static_cast<std::underlying_type_t<TState>>(value))) +
                           " has no name in StateTraits");
}

/**
 * @brief Parse a canonical name back into a state value (case-sensitive)
 * @return The enumerator, or nullopt if no enumerator carries that name
 */
template <typename TState> std::optional<TState> parseState(std::string_view name) {
    static_assert(std::is_enum_v<TState>, "DFSM state types must be enumerations");

    for (const auto &entry : StateTraits<TState>::names) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    return std::nullopt;
}

/**
 * @brief Named identity of one point in the state space
 *
 * Two states are equal iff their names are equal.
 */
template <typename TState> class State {
public:
    explicit State(TState value) : value_(value), name_(stateName(value)) {}

    TState value() const {
        return value_;
    }

    const std::string &name() const {
        return name_;
    }

    bool operator==(const State &other) const {
        return name_ == other.name_;
    }

private:
    TState value_;
    std::string name_;
};

}  // namespace DFSM

template <typename TState> struct std::hash<DFSM::State<TState>> {
    std::size_t operator()(const DFSM::State<TState> &state) const noexcept {
        return std::hash<std::string>{}(state.name());
    }
};
