// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "common/FsmError.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "model/State.h"
#include "model/StateMachineDefinition.h"
#include "model/Transition.h"
#include "model/TransitionRegistry.h"
#include "serialization/LoadOptions.h"
#include "serialization/SerializableStateMachine.h"
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace DFSM {

/**
 * @brief Fluent accumulator producing StateMachineDefinition snapshots
 *
 * Endpoints referenced by addTransition() and the initial state are added to
 * the state set automatically, so every built definition is structurally
 * sound. Transitions keep their declaration order, which is the order the
 * runtime evaluates them in.
 *
 * @code
 * auto registry = std::make_shared<TransitionRegistry<OrderState, OrderContext>>();
 * registry->registerCondition("PaymentReceived", [](const OrderContext &ctx) { return ctx.paymentReceived; });
 *
 * auto builder = FiniteStateMachineBuilder<OrderState, OrderContext>::create("Order");
 * builder.withInitialState(OrderState::Created)
 *     .withRegistry(registry)
 *     .addTransition(OrderState::Created, OrderState::Paid)
 *     .when("PaymentReceived")
 *     .done();
 *
 * FiniteStateMachine<OrderState, OrderContext> machine(builder.build());
 * @endcode
 */
template <typename TState, typename TContext> class FiniteStateMachineBuilder {
public:
    using Registry = TransitionRegistry<TState, TContext>;
    using Definition = StateMachineDefinition<TState, TContext>;
    using TransitionType = Transition<TState, TContext>;
    using Condition = typename TransitionType::Condition;
    using SideEffect = typename TransitionType::SideEffect;

    /**
     * @brief Scoped builder for one (from, to) edge
     *
     * done() appends the finished transition to the parent and hands the
     * parent back for further chaining. A TransitionBuilder dropped without
     * done() contributes nothing.
     */
    class TransitionBuilder {
    public:
        TransitionBuilder(FiniteStateMachineBuilder &parent, TState from, TState to)
            : parent_(parent), from_(from), to_(to) {}

        /**
         * @brief Guard the transition with an inline predicate
         * @param name Registry name recorded for serialization, if any
         */
        TransitionBuilder &when(Condition condition, std::optional<std::string> name = std::nullopt) {
            condition_ = std::move(condition);
            conditionName_ = std::move(name);
            return *this;
        }

        /**
         * @brief Guard the transition with a condition registered under @p name
         * @throws FsmException InvalidConfiguration if no registry was set
         * @throws FsmException UnknownCondition if the registry has no such condition
         */
        TransitionBuilder &when(const std::string &name) {
            const Registry &registry = parent_.requireRegistry("when");
            const Condition *condition = registry.findCondition(name);
            if (!condition) {
                throw FsmException(ErrorCode::UnknownCondition, "Condition '" + name + "' not found in registry");
            }
            condition_ = *condition;
            conditionName_ = name;
            return *this;
        }

        /**
         * @brief Attach an inline side effect
         * @param name Registry name recorded for serialization, if any
         */
        TransitionBuilder &withSideEffect(SideEffect effect, std::optional<std::string> name = std::nullopt) {
            sideEffect_ = std::move(effect);
            sideEffectName_ = std::move(name);
            return *this;
        }

        /**
         * @brief Attach the side effect registered under @p name
         * @throws FsmException InvalidConfiguration if no registry was set
         * @throws FsmException UnknownSideEffect if the registry has no such side effect
         */
        TransitionBuilder &withSideEffect(const std::string &name) {
            const Registry &registry = parent_.requireRegistry("withSideEffect");
            const SideEffect *effect = registry.findSideEffect(name);
            if (!effect) {
                throw FsmException(ErrorCode::UnknownSideEffect, "Side effect '" + name + "' not found in registry");
            }
            sideEffect_ = *effect;
            sideEffectName_ = name;
            return *this;
        }

        FiniteStateMachineBuilder &done() {
            parent_.transitions_.emplace_back(from_, to_, std::move(condition_), std::move(sideEffect_),
                                              std::move(conditionName_), std::move(sideEffectName_));
            return parent_;
        }

    private:
        FiniteStateMachineBuilder &parent_;
        TState from_;
        TState to_;
        Condition condition_;
        SideEffect sideEffect_;
        std::optional<std::string> conditionName_;
        std::optional<std::string> sideEffectName_;
    };

    static FiniteStateMachineBuilder create(std::string entityLabel) {
        return FiniteStateMachineBuilder(std::move(entityLabel));
    }

    /**
     * @brief Build a definition straight from a persisted form
     * @see loadFrom
     */
    static FiniteStateMachineBuilder fromSerializable(const SerializableStateMachine &dto,
                                                      std::shared_ptr<const Registry> registry,
                                                      const LoadOptions &options = {}) {
        FiniteStateMachineBuilder builder(dto.entityLabel);
        builder.loadFrom(dto, std::move(registry), options);
        return builder;
    }

    /**
     * @brief Set the initial state, adding it to the state set if needed
     */
    FiniteStateMachineBuilder &withInitialState(TState state) {
        initial_ = state;
        addState(state);
        return *this;
    }

    /**
     * @brief Registry used by the name-only when()/withSideEffect() overloads
     * @throws FsmException InvalidConfiguration if @p registry is null
     */
    FiniteStateMachineBuilder &withRegistry(std::shared_ptr<const Registry> registry) {
        if (!registry) {
            throw FsmException(ErrorCode::InvalidConfiguration, "Transition registry must not be null");
        }
        registry_ = std::move(registry);
        return *this;
    }

    /**
     * @brief Start a transition; both endpoints join the state set
     */
    TransitionBuilder addTransition(TState from, TState to) {
        addState(from);
        addState(to);
        return TransitionBuilder(*this, from, to);
    }

    /**
     * @brief Snapshot the current configuration
     *
     * May be called repeatedly; every call yields an independent definition.
     *
     * @throws FsmException MissingInitialState if withInitialState() was never called
     */
    std::shared_ptr<const Definition> build() const {
        TState initial = requireInitialState("build");
        auto definition = std::make_shared<const Definition>(entityLabel_, states_, transitions_, initial);
        LOG_DEBUG("Built definition '{}': {} states, {} transitions", entityLabel_, states_.size(),
                  transitions_.size());
        return definition;
    }

    /**
     * @brief Project the configuration onto its name-only persisted form
     *
     * Guards and side effects are written as their registry names; inline
     * ones registered without a name are written as absent.
     *
     * @throws FsmException MissingInitialState if withInitialState() was never called
     */
    SerializableStateMachine toSerializable() const {
        TState initial = requireInitialState("toSerializable");

        SerializableStateMachine dto;
        dto.entityLabel = entityLabel_;
        dto.initialState = stateName(initial);
        dto.states.reserve(states_.size());
        for (TState state : states_) {
            dto.states.push_back(stateName(state));
        }
        dto.transitions.reserve(transitions_.size());
        for (const auto &transition : transitions_) {
            dto.transitions.push_back(SerializableTransition{transition.from().name(), transition.to().name(),
                                                             transition.conditionName(), transition.sideEffectName()});
        }
        return dto;
    }

    /**
     * @brief Replace the configuration with a persisted definition
     *
     * Label, initial state, states and transitions are taken from @p dto.
     * Condition and side-effect names resolve through @p registry, which also
     * becomes the builder's registry if none was set. Names are kept on the
     * loaded transitions whether or not they resolved, so toSerializable()
     * reproduces @p dto.
     *
     * Under NameResolution::Lenient an unresolved condition degrades to
     * "always eligible" and an unresolved side effect to a no-op, each with a
     * warning. Under NameResolution::Strict they throw.
     *
     * The builder is left untouched if loading throws.
     *
     * @throws FsmException InvalidConfiguration if @p registry is null
     * @throws FsmException UnknownStateName if a state name has no enumerator
     * @throws FsmException UnknownCondition / UnknownSideEffect under Strict resolution
     */
    FiniteStateMachineBuilder &loadFrom(const SerializableStateMachine &dto, std::shared_ptr<const Registry> registry,
                                        const LoadOptions &options = {}) {
        if (!registry) {
            throw FsmException(ErrorCode::InvalidConfiguration, "Transition registry must not be null");
        }

        TState initial = parseStateName(dto.initialState);

        std::vector<TState> states;
        states.reserve(dto.states.size() + 1);
        auto collect = [&states](TState state) {
            if (std::find(states.begin(), states.end(), state) == states.end()) {
                states.push_back(state);
            }
        };
        for (const auto &name : dto.states) {
            collect(parseStateName(name));
        }
        collect(initial);

        std::vector<TransitionType> transitions;
        transitions.reserve(dto.transitions.size());
        for (const auto &entry : dto.transitions) {
            TState from = parseStateName(entry.from);
            TState to = parseStateName(entry.to);
            collect(from);
            collect(to);

            Condition condition;
            if (entry.conditionName) {
                condition = resolveCondition(*registry, entry, options);
            }
            SideEffect sideEffect;
            if (entry.sideEffectName) {
                sideEffect = resolveSideEffect(*registry, entry, options);
            }
            transitions.emplace_back(from, to, std::move(condition), std::move(sideEffect), entry.conditionName,
                                     entry.sideEffectName);
        }

        entityLabel_ = dto.entityLabel;
        initial_ = initial;
        states_ = std::move(states);
        transitions_ = std::move(transitions);
        if (!registry_) {
            registry_ = std::move(registry);
        }

        LOG_DEBUG("Loaded definition '{}': {} states, {} transitions", Log::sanitize(entityLabel_), states_.size(),
                  transitions_.size());
        return *this;
    }

    const std::string &entityLabel() const {
        return entityLabel_;
    }

    const std::optional<TState> &initialState() const {
        return initial_;
    }

    /**
     * @brief States in insertion order
     */
    const std::vector<TState> &states() const {
        return states_;
    }

    const std::vector<TransitionType> &transitions() const {
        return transitions_;
    }

    const std::shared_ptr<const Registry> &registry() const {
        return registry_;
    }

private:
    explicit FiniteStateMachineBuilder(std::string entityLabel) : entityLabel_(std::move(entityLabel)) {}

    void addState(TState state) {
        if (std::find(states_.begin(), states_.end(), state) == states_.end()) {
            states_.push_back(state);
        }
    }

    TState requireInitialState(const char *operation) const {
        if (!initial_) {
            throw FsmException(ErrorCode::MissingInitialState, std::string(operation) + "() on '" + entityLabel_ +
                                                                   "' requires withInitialState() first");
        }
        return *initial_;
    }

    const Registry &requireRegistry(const char *operation) const {
        if (!registry_) {
            throw FsmException(ErrorCode::InvalidConfiguration,
                               std::string(operation) + "(name) requires withRegistry() to be called first");
        }
        return *registry_;
    }

    static TState parseStateName(const std::string &name) {
        auto state = parseState<TState>(name);
        if (!state) {
            throw FsmException(ErrorCode::UnknownStateName, "'" + Log::sanitize(name) + "' is not a valid state name");
        }
        return *state;
    }

    static Condition resolveCondition(const Registry &registry, const SerializableTransition &entry,
                                      const LoadOptions &options) {
        const std::string &name = *entry.conditionName;
        if (const Condition *condition = registry.findCondition(name)) {
            return *condition;
        }
        if (options.nameResolution == NameResolution::Strict) {
            throw FsmException(ErrorCode::UnknownCondition, "Condition '" + Log::sanitize(name) +
                                                                "' not found in registry");
        }
        LOG_WARN("Condition '{}' on {} -> {} is not registered; transition is now unconditionally eligible",
                 Log::sanitize(name), Log::sanitize(entry.from), Log::sanitize(entry.to));
        return {};
    }

    static SideEffect resolveSideEffect(const Registry &registry, const SerializableTransition &entry,
                                        const LoadOptions &options) {
        const std::string &name = *entry.sideEffectName;
        if (const SideEffect *effect = registry.findSideEffect(name)) {
            return *effect;
        }
        if (options.nameResolution == NameResolution::Strict) {
            throw FsmException(ErrorCode::UnknownSideEffect, "Side effect '" + Log::sanitize(name) +
                                                                 "' not found in registry");
        }
        LOG_WARN("Side effect '{}' on {} -> {} is not registered; it will not run", Log::sanitize(name),
                 Log::sanitize(entry.from), Log::sanitize(entry.to));
        return {};
    }

    std::string entityLabel_;
    std::optional<TState> initial_;
    std::shared_ptr<const Registry> registry_;
    std::vector<TState> states_;
    std::vector<TransitionType> transitions_;
};

}  // namespace DFSM
