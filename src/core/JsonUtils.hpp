// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcpgate::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int64_t defaultValue)
    -> int64_t
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int64_t>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts an array of strings, skipping non-string elements.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_array())
        return result;

    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            result.push_back(item.get<std::string>());
    }
    return result;
}

/// @brief Extracts an object of string values, skipping non-string members.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_object())
        return result;

    for (const auto& [name, value]: obj[keyStr].items())
    {
        if (value.is_string())
            result[name] = value.get<std::string>();
    }
    return result;
}

} // namespace mcpgate::json
