// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace DFSM {

using json = nlohmann::json;

/**
 * @brief nlohmann/json helpers shared by the definition codec
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON text
     * @param jsonString Input text
     * @param errorOut Receives "document is empty" or the failing byte offset
     * @return Parsed value or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    /**
     * @brief Check if object has key and it is not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Read an optional string member
     * @return nullopt if the key is missing or null
     * @throws json::type_error if the member is present but not a string
     */
    static std::optional<std::string> getOptionalString(const json &object, const std::string &key);

    /**
     * @brief Read a required array of strings
     * @throws json::out_of_range if the key is missing
     * @throws FsmException MalformedDocument if the member is not an array
     * @throws json::type_error if an element is not a string
     */
    static std::vector<std::string> getStringArray(const json &object, const std::string &key);
};

}  // namespace DFSM
