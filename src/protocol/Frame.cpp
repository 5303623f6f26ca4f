// SPDX-License-Identifier: Apache-2.0
#include "Frame.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace gatelink::frame
{

auto makeRequest(std::string_view id, std::string_view method, nlohmann::ordered_json params) -> nlohmann::ordered_json
{
    return nlohmann::ordered_json {
        { "type", "req" },
        { "id", id },
        { "method", method },
        { "params", params.is_null() ? nlohmann::ordered_json::object() : std::move(params) },
    };
}

auto makeEvent(std::string_view name, nlohmann::ordered_json payload, std::optional<std::int64_t> seq)
    -> nlohmann::ordered_json
{
    auto msg = nlohmann::ordered_json {
        { "type", "event" },
        { "event", name },
        { "payload", std::move(payload) },
    };
    if (seq)
        msg["seq"] = *seq;
    return msg;
}

auto makeResponse(std::string_view id, bool ok, nlohmann::ordered_json payloadOrError) -> nlohmann::ordered_json
{
    auto msg = nlohmann::ordered_json {
        { "type", "res" },
        { "id", id },
        { "ok", ok },
    };
    msg[ok ? "payload" : "error"] = std::move(payloadOrError);
    return msg;
}

auto parse(const nlohmann::ordered_json& message) -> Result<Frame>
{
    if (!message.is_object())
        return makeError(ErrorCode::ParseError, "Frame is not a JSON object");

    auto const type = json::getStringOr(message, "type", "");

    if (type == "event")
    {
        auto name = json::getString(message, "event");
        if (!name)
            return std::unexpected(name.error());
        auto const* payload = json::find(message, "payload");
        return Event {
            .name = std::move(*name),
            .payload = payload ? *payload : nlohmann::ordered_json::object(),
            .seq = json::getOptionalInt64(message, "seq"),
        };
    }

    if (type == "res")
    {
        auto id = json::getString(message, "id");
        if (!id)
            return std::unexpected(id.error());
        auto response = Response { .id = std::move(*id), .ok = json::getBoolOr(message, "ok", false) };
        if (auto const* payload = json::find(message, "payload"); payload && !payload->is_null())
            response.payload = *payload;
        if (auto const* error = json::find(message, "error"))
            response.error = *error;
        return response;
    }

    if (type == "req")
    {
        auto id = json::getString(message, "id");
        if (!id)
            return std::unexpected(id.error());
        auto method = json::getString(message, "method");
        if (!method)
            return std::unexpected(method.error());
        auto const* params = json::find(message, "params");
        return Request {
            .id = std::move(*id),
            .method = std::move(*method),
            .params = params ? *params : nlohmann::ordered_json::object(),
        };
    }

    return makeError(ErrorCode::ParseError, std::format("Unknown frame type '{}'", type));
}

auto parseText(std::string_view text) -> Result<Frame>
{
    return json::parse(text).and_then([](const nlohmann::ordered_json& message) { return parse(message); });
}

auto formatError(const nlohmann::ordered_json& error) -> std::string
{
    if (error.is_string())
        return error.get<std::string>();
    if (error.is_object())
    {
        if (auto const message = json::getOptionalString(error, "message"))
            return *message;
        return error.dump();
    }
    if (error.is_null())
        return "Unknown error";
    return error.dump();
}

} // namespace gatelink::frame
