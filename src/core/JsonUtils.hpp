// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace voicetutor::json
{

/// @brief Parses a JSON document. Syntax errors come back as ProtocolError.
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

namespace detail
{
    /// @brief Returns the member @p key of @p obj, or nullptr if @p obj is not an object or lacks it.
    inline auto member(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
    {
        if (!obj.is_object())
            return nullptr;
        auto const it = obj.find(key);
        return it == obj.end() ? nullptr : &*it;
    }
} // namespace detail

/// @brief Extracts a required string field from a JSON object.
/// @return The string value, or ProtocolError when it is missing or not a string.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const* value = detail::member(obj, key);
    if (!value || !value->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return value->get<std::string>();
}

[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const* value = detail::member(obj, key);
    return value && value->is_string() ? value->get<std::string>() : std::string(defaultValue);
}

[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const* value = detail::member(obj, key);
    return value && value->is_number_integer() ? value->get<int>() : defaultValue;
}

/// @brief Extracts a float field; integers are accepted as well.
[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    auto const* value = detail::member(obj, key);
    return value && value->is_number() ? value->get<float>() : defaultValue;
}

[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const* value = detail::member(obj, key);
    return value && value->is_boolean() ? value->get<bool>() : defaultValue;
}

/// @brief Extracts a duration stored as an integer number of milliseconds.
[[nodiscard]] inline auto getMillisOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::chrono::milliseconds defaultValue) -> std::chrono::milliseconds
{
    auto const* value = detail::member(obj, key);
    if (!value || !value->is_number_integer())
        return defaultValue;
    return std::chrono::milliseconds { value->get<std::chrono::milliseconds::rep>() };
}

/// @brief Extracts an array of strings.
///
/// Non-string elements are skipped. A missing or non-array field yields the default.
[[nodiscard]] inline auto getStringArrayOr(const nlohmann::json& obj,
                                           std::string_view key,
                                           std::vector<std::string> defaultValue) -> std::vector<std::string>
{
    auto const* value = detail::member(obj, key);
    if (!value || !value->is_array())
        return defaultValue;

    auto values = std::vector<std::string> {};
    for (auto const& element: *value)
        if (element.is_string())
            values.push_back(element.get<std::string>());
    return values;
}

/// @brief Extracts a nested object, or an empty object when it is missing.
[[nodiscard]] inline auto getObjectOr(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto const* value = detail::member(obj, key);
    return value && value->is_object() ? *value : nlohmann::json::object();
}

} // namespace voicetutor::json
