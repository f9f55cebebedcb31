// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "model/State.h"
#include "model/TransitionFunctions.h"
#include <optional>
#include <string>
#include <utility>

namespace DFSM {

/**
 * @brief Directed edge between two states
 *
 * Carries a guard (never empty, defaults to always eligible), an optional
 * side effect, and the registry names of both when they were referenced by
 * name. Only the names survive serialization.
 */
template <typename TState, typename TContext> class Transition {
public:
    using Condition = ConditionFn<TContext>;
    using SideEffect = SideEffectFn<TState, TContext>;

    Transition(TState from, TState to, Condition condition = {}, SideEffect sideEffect = {},
               std::optional<std::string> conditionName = std::nullopt,
               std::optional<std::string> sideEffectName = std::nullopt)
        : from_(from), to_(to), condition_(condition ? std::move(condition) : alwaysEligible()),
          sideEffect_(std::move(sideEffect)), conditionName_(std::move(conditionName)),
          sideEffectName_(std::move(sideEffectName)) {}

    const State<TState> &from() const {
        return from_;
    }

    const State<TState> &to() const {
        return to_;
    }

    const Condition &condition() const {
        return condition_;
    }

    const SideEffect &sideEffect() const {
        return sideEffect_;
    }

    bool hasSideEffect() const {
        return static_cast<bool>(sideEffect_);
    }

    const std::optional<std::string> &conditionName() const {
        return conditionName_;
    }

    const std::optional<std::string> &sideEffectName() const {
        return sideEffectName_;
    }

    bool connects(const State<TState> &from, const State<TState> &to) const {
        return from_ == from && to_ == to;
    }

    /**
     * @brief Evaluate the guard; exceptions thrown by the guard propagate
     */
    bool isEligible(const TContext &context) const {
        return condition_(context);
    }

    /**
     * @brief Run the side effect, if any, with (context, from, to)
     */
    void apply(TContext &context) const {
        if (sideEffect_) {
            sideEffect_(context, from_.value(), to_.value());
        }
    }

    static Condition alwaysEligible() {
        return [](const TContext &) { return true; };
    }

private:
    State<TState> from_;
    State<TState> to_;
    Condition condition_;
    SideEffect sideEffect_;
    std::optional<std::string> conditionName_;
    std::optional<std::string> sideEffectName_;
};

}  // namespace DFSM
