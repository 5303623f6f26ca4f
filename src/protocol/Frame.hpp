// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gatelink::frame
{

/// @brief A request frame: `{type:"req", id, method, params}`.
struct Request
{
    std::string id;
    std::string method;
    nlohmann::ordered_json params;
};

/// @brief A response frame: `{type:"res", id, ok, payload|error}`.
struct Response
{
    std::string id;
    bool ok = false;
    std::optional<nlohmann::ordered_json> payload;
    nlohmann::ordered_json error;
};

/// @brief A push event frame: `{type:"event", event, payload, seq?}`.
struct Event
{
    std::string name;
    nlohmann::ordered_json payload;
    std::optional<std::int64_t> seq;
};

/// @brief Any frame of the gateway wire protocol.
using Frame = std::variant<Request, Response, Event>;

/// @brief Builds a request frame.
/// @param id The request id used to correlate the response.
/// @param method The method name.
/// @param params The parameters object (an empty object if null).
/// @return The request frame as JSON.
[[nodiscard]] auto makeRequest(std::string_view id, std::string_view method, nlohmann::ordered_json params = nullptr)
    -> nlohmann::ordered_json;

/// @brief Serializes an event frame (used by tests and loopback tooling).
[[nodiscard]] auto makeEvent(std::string_view name,
                             nlohmann::ordered_json payload,
                             std::optional<std::int64_t> seq = std::nullopt) -> nlohmann::ordered_json;

/// @brief Serializes a response frame (used by tests and loopback tooling).
[[nodiscard]] auto makeResponse(std::string_view id, bool ok, nlohmann::ordered_json payloadOrError)
    -> nlohmann::ordered_json;

/// @brief Parses a JSON value into a typed frame.
/// @param message The decoded JSON message.
/// @return The frame, or a ParseError if the shape is not a known frame.
[[nodiscard]] auto parse(const nlohmann::ordered_json& message) -> Result<Frame>;

/// @brief Parses raw frame text.
[[nodiscard]] auto parseText(std::string_view text) -> Result<Frame>;

/// @brief Extracts a human readable message from a remote error value.
///
/// Uses `message` of an error object, the string itself for string errors, and the
/// JSON dump otherwise.
[[nodiscard]] auto formatError(const nlohmann::ordered_json& error) -> std::string;

} // namespace gatelink::frame
