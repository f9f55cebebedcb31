// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include "common/JsonUtils.h"
#include "serialization/SerializableStateMachine.h"
#include <string>

namespace DFSM {

// nlohmann/json ADL hooks
void to_json(json &j, const SerializableTransition &transition);
void from_json(const json &j, SerializableTransition &transition);
void to_json(json &j, const SerializableStateMachine &definition);
void from_json(const json &j, SerializableStateMachine &definition);

/**
 * @brief JSON encoding of SerializableStateMachine
 *
 * Document shape:
 * @code
 * {
 *   "entityLabel": "Ticket",
 *   "initialState": "Open",
 *   "states": ["Open", "InProgress", "Resolved"],
 *   "transitions": [
 *     {"from": "Open", "to": "InProgress", "conditionName": "AgentAssigned"}
 *   ]
 * }
 * @endcode
 *
 * Absent condition/side-effect names are omitted on write; omitted and null
 * are both accepted on read. "transitions" may be omitted for a machine
 * without edges.
 */
class DefinitionJsonCodec {
public:
    static json toJsonValue(const SerializableStateMachine &definition);

    /**
     * @throws FsmException MalformedDocument on missing members or wrong member types
     */
    static SerializableStateMachine fromJsonValue(const json &value);

    /**
     * @throws FsmException MalformedDocument if a label or name is not valid UTF-8
     */
    static std::string toJson(const SerializableStateMachine &definition, bool pretty = true);

    /**
     * @throws FsmException MalformedDocument if the text is not valid JSON or has the wrong shape
     */
    static SerializableStateMachine fromJson(const std::string &text);
};

}  // namespace DFSM
