// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "common/FsmError.h"
#include "model/State.h"
#include "model/Transition.h"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace DFSM {

/**
 * @brief Immutable description of a machine: label, states, transitions, initial state
 *
 * Never mutated after construction, so one instance can back any number of
 * FiniteStateMachine cursors across threads.
 *
 * The constructor enforces structural integrity: the initial state and every
 * transition endpoint must belong to the state set. Duplicate states collapse
 * onto their first occurrence, which keeps the serialized order stable.
 */
template <typename TState, typename TContext> class StateMachineDefinition {
public:
    using StateType = State<TState>;
    using TransitionType = Transition<TState, TContext>;

    /**
     * @throws FsmException StructuralIntegrity if a referenced state is missing from @p states
     */
    StateMachineDefinition(std::string entityLabel, const std::vector<TState> &states,
                           std::vector<TransitionType> transitions, TState initialState)
        : entityLabel_(std::move(entityLabel)), transitions_(std::move(transitions)), initialState_(initialState) {
        states_.reserve(states.size());
        for (TState value : states) {
            StateType state(value);
            if (std::find(states_.begin(), states_.end(), state) == states_.end()) {
                states_.push_back(std::move(state));
            }
        }

        if (!hasState(initialState_)) {
            throw FsmException(ErrorCode::StructuralIntegrity, "Initial state '" + initialState_.name() +
                                                                   "' is not part of definition '" + entityLabel_ + "'");
        }

        for (const auto &transition : transitions_) {
            if (!hasState(transition.from()) || !hasState(transition.to())) {
                throw FsmException(ErrorCode::StructuralIntegrity,
                                   "Transition " + transition.from().name() + " -> " + transition.to().name() +
                                       " references a state outside definition '" + entityLabel_ + "'");
            }
        }
    }

    const std::string &entityLabel() const {
        return entityLabel_;
    }

    /**
     * @brief States in insertion order
     */
    const std::vector<StateType> &states() const {
        return states_;
    }

    /**
     * @brief Transitions in declaration order, which is also the evaluation order
     */
    const std::vector<TransitionType> &transitions() const {
        return transitions_;
    }

    const StateType &initialState() const {
        return initialState_;
    }

    bool hasState(const StateType &state) const {
        return std::find(states_.begin(), states_.end(), state) != states_.end();
    }

    bool hasState(TState value) const {
        return hasState(StateType(value));
    }

private:
    std::string entityLabel_;
    std::vector<StateType> states_;
    std::vector<TransitionType> transitions_;
    StateType initialState_;
};

}  // namespace DFSM
