// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace gatelink::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::ordered_json>
{
    try
    {
        return nlohmann::ordered_json::parse(input);
    }
    catch (const nlohmann::ordered_json::parse_error& e)
    {
        return makeError(ErrorCode::ParseError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns a pointer to a member of a JSON object, or nullptr if absent.
/// @param obj The JSON value (may be any type; non-objects yield nullptr).
/// @param key The field name.
[[nodiscard]] inline auto find(const nlohmann::ordered_json& obj, std::string_view key) -> const nlohmann::ordered_json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return nullptr;
    return &*it;
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::ordered_json& obj, std::string_view key) -> Result<std::string>
{
    auto const* value = find(obj, key);
    if (!value || !value->is_string())
        return makeError(ErrorCode::ParseError, std::format("Missing or invalid string field: {}", key));
    return value->get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::ordered_json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const* value = find(obj, key);
    if (value && value->is_string())
        return value->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts a string field, distinguishing absence from an empty string.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value, or std::nullopt if missing or not a string.
[[nodiscard]] inline auto getOptionalString(const nlohmann::ordered_json& obj, std::string_view key)
    -> std::optional<std::string>
{
    auto const* value = find(obj, key);
    if (value && value->is_string())
        return value->get<std::string>();
    return std::nullopt;
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::ordered_json& obj, std::string_view key, int defaultValue) -> int
{
    auto const* value = find(obj, key);
    if (value && value->is_number_integer())
        return value->get<int>();
    return defaultValue;
}

/// @brief Extracts an integer field, distinguishing absence from zero.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The integer value, or std::nullopt if missing or not an integer.
///         Whole-valued floats (5.0) count as integers.
[[nodiscard]] inline auto getOptionalInt64(const nlohmann::ordered_json& obj, std::string_view key)
    -> std::optional<std::int64_t>
{
    constexpr auto MaxExactDouble = 9007199254740992.0; // 2^53

    auto const* value = find(obj, key);
    if (!value)
        return std::nullopt;
    if (value->is_number_integer())
        return value->get<std::int64_t>();
    if (value->is_number_float())
    {
        auto const number = value->get<double>();
        if (std::isfinite(number) && number == std::trunc(number) && std::abs(number) <= MaxExactDouble)
            return static_cast<std::int64_t>(number);
    }
    return std::nullopt;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::ordered_json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const* value = find(obj, key);
    if (value && value->is_boolean())
        return value->get<bool>();
    return defaultValue;
}

} // namespace gatelink::json
