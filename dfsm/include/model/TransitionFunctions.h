// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include <functional>

namespace DFSM {

/**
 * @brief Guard predicate evaluated against the context
 *
 * Must be free of side effects; it may run twice per attempted transition.
 */
template <typename TContext> using ConditionFn = std::function<bool(const TContext &)>;

/**
 * @brief Action run on a successful transition with (context, from, to)
 */
template <typename TState, typename TContext> using SideEffectFn = std::function<void(TContext &, TState, TState)>;

/**
 * @brief Context-only action, adapted to SideEffectFn on registration
 */
template <typename TContext> using ContextSideEffectFn = std::function<void(TContext &)>;

}  // namespace DFSM
