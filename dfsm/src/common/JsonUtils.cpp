// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#include "common/JsonUtils.h"
#include "common/FsmError.h"
#include "common/Logger.h"

namespace DFSM {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    auto fail = [errorOut](const std::string &reason) -> std::optional<json> {
        if (errorOut) {
            *errorOut = reason;
        }
        return std::nullopt;
    };

    if (jsonString.find_first_not_of(" \t\r\n") == std::string::npos) {
        return fail("document is empty");
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        LOG_DEBUG("Rejected JSON input at byte {}: {}", e.byte, e.what());
        return fail("parse error at byte " + std::to_string(e.byte));
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return false;
    }
    auto it = object.find(key);
    return it != object.end() && !it->is_null();
}

std::optional<std::string> JsonUtils::getOptionalString(const json &object, const std::string &key) {
    if (!hasKey(object, key)) {
        return std::nullopt;
    }
    return object.at(key).get<std::string>();
}

std::vector<std::string> JsonUtils::getStringArray(const json &object, const std::string &key) {
    const json &array = object.at(key);
    if (!array.is_array()) {
        throw FsmException(ErrorCode::MalformedDocument, "'" + key + "' must be an array of strings");
    }

    std::vector<std::string> values;
    values.reserve(array.size());
    for (const auto &element : array) {
        values.push_back(element.get<std::string>());
    }
    return values;
}

}  // namespace DFSM
