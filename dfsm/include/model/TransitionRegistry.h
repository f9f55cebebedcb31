// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "model/TransitionFunctions.h"
#include <string>
#include <unordered_map>
#include <utility>

namespace DFSM {

/**
 * @brief Named guards and side effects shared by definitions
 *
 * Lets transitions reference reusable logic by name so that persisted
 * definitions carry names only. Registration overwrites silently: the last
 * registration under a name wins.
 *
 * Not synchronized. Register everything during setup, then share the
 * registry read-only; concurrent registration and lookup must be guarded by
 * the caller.
 */
template <typename TState, typename TContext> class TransitionRegistry {
public:
    using Condition = ConditionFn<TContext>;
    using SideEffect = SideEffectFn<TState, TContext>;
    using ContextSideEffect = ContextSideEffectFn<TContext>;

    void registerCondition(const std::string &name, Condition condition) {
        conditions_[name] = std::move(condition);
    }

    void registerSideEffect(const std::string &name, SideEffect effect) {
        sideEffects_[name] = std::move(effect);
    }

    /**
     * @brief Register a side effect that only needs the context
     */
    void registerSideEffect(const std::string &name, ContextSideEffect effect) {
        if (!effect) {
            sideEffects_[name] = SideEffect{};
            return;
        }
        sideEffects_[name] = [effect = std::move(effect)](TContext &context, TState, TState) { effect(context); };
    }

    const Condition *findCondition(const std::string &name) const {
        auto it = conditions_.find(name);
        return it == conditions_.end() ? nullptr : &it->second;
    }

    const SideEffect *findSideEffect(const std::string &name) const {
        auto it = sideEffects_.find(name);
        return it == sideEffects_.end() ? nullptr : &it->second;
    }

    bool hasCondition(const std::string &name) const {
        return conditions_.contains(name);
    }

    bool hasSideEffect(const std::string &name) const {
        return sideEffects_.contains(name);
    }

    const std::unordered_map<std::string, Condition> &conditions() const {
        return conditions_;
    }

    const std::unordered_map<std::string, SideEffect> &sideEffects() const {
        return sideEffects_;
    }

private:
    std::unordered_map<std::string, Condition> conditions_;
    std::unordered_map<std::string, SideEffect> sideEffects_;
};

}  // namespace DFSM
