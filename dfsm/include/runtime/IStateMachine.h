// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

namespace DFSM {

/**
 * @brief Cursor over an enumerated state space
 *
 * Implementations evaluate guarded transitions against a caller-owned
 * context. A single instance is not safe for concurrent transition attempts;
 * callers serialize access per instance.
 */
template <typename TState, typename TContext> class IStateMachine {
public:
    virtual ~IStateMachine() = default;

    /**
     * @brief Current state of the cursor
     */
    virtual TState current() const = 0;

    /**
     * @brief Check whether a transition from current() to @p target is eligible for @p context
     */
    virtual bool canTransitionTo(TState target, const TContext &context) const = 0;

    /**
     * @brief Take the first eligible transition from current() to @p target
     * @return true if a transition was taken, false if none was eligible
     */
    virtual bool tryTransitionTo(TState target, TContext &context) = 0;
};

}  // namespace DFSM
