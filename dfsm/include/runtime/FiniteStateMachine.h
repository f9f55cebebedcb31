// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "common/FsmError.h"
#include "common/Logger.h"
#include "model/State.h"
#include "model/StateMachineDefinition.h"
#include "runtime/IStateMachine.h"
#include <memory>
#include <string>

namespace DFSM {

/**
 * @brief Runtime cursor over an immutable StateMachineDefinition
 *
 * Starts at the definition's initial state. A transition attempt scans the
 * definition's transitions in declaration order and takes the first one whose
 * endpoints are (current, target) and whose guard accepts the context.
 *
 * Transitions to the current state get no special treatment: without an
 * explicit self-transition the attempt fails.
 *
 * Guard and side-effect exceptions propagate to the caller. The cursor moves
 * only after the side effect has returned, so a throwing side effect leaves
 * the machine in its previous state.
 */
template <typename TState, typename TContext>
class FiniteStateMachine : public IStateMachine<TState, TContext> {
public:
    using Definition = StateMachineDefinition<TState, TContext>;
    using TransitionType = typename Definition::TransitionType;

    /**
     * @throws FsmException InvalidConfiguration if @p definition is null
     */
    explicit FiniteStateMachine(std::shared_ptr<const Definition> definition)
        : definition_(requireDefinition(std::move(definition))), current_(definition_->initialState()) {}

    TState current() const override {
        return current_.value();
    }

    const State<TState> &currentState() const {
        return current_;
    }

    const std::shared_ptr<const Definition> &definition() const {
        return definition_;
    }

    bool canTransitionTo(TState target, const TContext &context) const override {
        return findTransition(target, context) != nullptr;
    }

    /**
     * @throws FsmException NullContext if @p context is null
     */
    bool canTransitionTo(TState target, const TContext *context) const {
        return canTransitionTo(target, requireContext(context));
    }

    bool tryTransitionTo(TState target, TContext &context) override {
        const TransitionType *transition = findTransition(target, context);
        if (!transition) {
            LOG_TRACE("'{}': no eligible transition {} -> {}", definition_->entityLabel(), current_.name(),
                      stateName(target));
            return false;
        }

        transition->apply(context);
        current_ = transition->to();
        LOG_DEBUG("'{}': {} -> {}", definition_->entityLabel(), transition->from().name(), current_.name());
        return true;
    }

    /**
     * @throws FsmException NullContext if @p context is null
     */
    bool tryTransitionTo(TState target, TContext *context) {
        return tryTransitionTo(target, requireContext(context));
    }

private:
    static std::shared_ptr<const Definition> requireDefinition(std::shared_ptr<const Definition> definition) {
        if (!definition) {
            throw FsmException(ErrorCode::InvalidConfiguration, "State machine definition must not be null");
        }
        return definition;
    }

    template <typename T> static T &requireContext(T *context) {
        if (!context) {
            throw FsmException(ErrorCode::NullContext, "Transition evaluated without a context");
        }
        return *context;
    }

    const TransitionType *findTransition(TState target, const TContext &context) const {
        State<TState> targetState(target);
        for (const auto &transition : definition_->transitions()) {
            if (transition.connects(current_, targetState) && transition.isEligible(context)) {
                return &transition;
            }
        }
        return nullptr;
    }

    std::shared_ptr<const Definition> definition_;
    State<TState> current_;
};

}  // namespace DFSM
