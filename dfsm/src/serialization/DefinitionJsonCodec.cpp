// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#include "serialization/DefinitionJsonCodec.h"
#include "common/FsmError.h"
#include "common/LogUtils.h"
#include "common/Logger.h"

namespace DFSM {

namespace {
constexpr const char *KEY_ENTITY_LABEL = "entityLabel";
constexpr const char *KEY_INITIAL_STATE = "initialState";
constexpr const char *KEY_STATES = "states";
constexpr const char *KEY_TRANSITIONS = "transitions";
constexpr const char *KEY_FROM = "from";
constexpr const char *KEY_TO = "to";
constexpr const char *KEY_CONDITION_NAME = "conditionName";
constexpr const char *KEY_SIDE_EFFECT_NAME = "sideEffectName";
}  // namespace

void to_json(json &j, const SerializableTransition &transition) {
    j = json{{KEY_FROM, transition.from}, {KEY_TO, transition.to}};
    if (transition.conditionName) {
        j[KEY_CONDITION_NAME] = *transition.conditionName;
    }
    if (transition.sideEffectName) {
        j[KEY_SIDE_EFFECT_NAME] = *transition.sideEffectName;
    }
}

void from_json(const json &j, SerializableTransition &transition) {
    j.at(KEY_FROM).get_to(transition.from);
    j.at(KEY_TO).get_to(transition.to);
    transition.conditionName = JsonUtils::getOptionalString(j, KEY_CONDITION_NAME);
    transition.sideEffectName = JsonUtils::getOptionalString(j, KEY_SIDE_EFFECT_NAME);
}

void to_json(json &j, const SerializableStateMachine &definition) {
    j = json{{KEY_ENTITY_LABEL, definition.entityLabel},
             {KEY_INITIAL_STATE, definition.initialState},
             {KEY_STATES, definition.states},
             {KEY_TRANSITIONS, definition.transitions}};
}

void from_json(const json &j, SerializableStateMachine &definition) {
    j.at(KEY_ENTITY_LABEL).get_to(definition.entityLabel);
    j.at(KEY_INITIAL_STATE).get_to(definition.initialState);
    definition.states = JsonUtils::getStringArray(j, KEY_STATES);
    if (JsonUtils::hasKey(j, KEY_TRANSITIONS)) {
        j.at(KEY_TRANSITIONS).get_to(definition.transitions);
    } else {
        definition.transitions.clear();
    }
}

json DefinitionJsonCodec::toJsonValue(const SerializableStateMachine &definition) {
    return json(definition);
}

SerializableStateMachine DefinitionJsonCodec::fromJsonValue(const json &value) {
    if (!value.is_object()) {
        throw FsmException(ErrorCode::MalformedDocument, "Definition document must be a JSON object");
    }

    try {
        return value.get<SerializableStateMachine>();
    } catch (const json::exception &e) {
        throw FsmException(ErrorCode::MalformedDocument, std::string("Invalid definition document: ") + e.what());
    }
}

std::string DefinitionJsonCodec::toJson(const SerializableStateMachine &definition, bool pretty) {
    json value = toJsonValue(definition);
    try {
        return pretty ? JsonUtils::toPrettyString(value) : JsonUtils::toCompactString(value);
    } catch (const json::type_error &e) {
        // Labels and names must be valid UTF-8
        throw FsmException(ErrorCode::MalformedDocument,
                           "Definition '" + Log::sanitize(definition.entityLabel) + "' cannot be encoded: " + e.what());
    }
}

SerializableStateMachine DefinitionJsonCodec::fromJson(const std::string &text) {
    std::string parseError;
    auto value = JsonUtils::parseJson(text, &parseError);
    if (!value) {
        throw FsmException(ErrorCode::MalformedDocument, "Definition is not valid JSON: " + parseError);
    }

    SerializableStateMachine definition = fromJsonValue(*value);
    LOG_DEBUG("Decoded definition '{}': {} states, {} transitions", Log::sanitize(definition.entityLabel),
              definition.states.size(), definition.transitions.size());
    return definition;
}

}  // namespace DFSM
