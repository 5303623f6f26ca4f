// SPDX-License-Identifier: Apache-2.0
#include "EventTranslator.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <string>

namespace gatelink
{

namespace
{
    auto payloadKeys(const nlohmann::ordered_json& payload) -> std::string
    {
        if (!payload.is_object())
            return "(none)";
        auto keys = std::string {};
        for (auto const& [key, value]: payload.items())
        {
            if (!keys.empty())
                keys += ',';
            keys += key;
        }
        return keys;
    }

    auto fromKind(const frame::Event& event) -> std::optional<CanonicalEvent>
    {
        auto payload = canonicalFromJson(event.payload);
        if (!payload)
        {
            log::debug("Dropping '{}' event: {}", event.name, payload.error().message);
            return std::nullopt;
        }
        return CanonicalEvent { .payload = std::move(*payload), .seq = event.seq };
    }
} // namespace

auto EventTranslator::translate(const frame::Event& event) -> std::optional<CanonicalEvent>
{
    if (event.name == "agent")
        return translateAgent(event);

    if (event.name == "chat")
        return translateChat(event);

    if (event.name == "health" || event.name == "tick" || event.name == "connect.challenge")
        return std::nullopt;

    if (json::find(event.payload, "kind"))
        return fromKind(event);

    log::debug("Dropping unrecognized event '{}' (seq {})",
               event.name,
               event.seq ? std::to_string(*event.seq) : "-");
    return std::nullopt;
}

auto EventTranslator::translateAgent(const frame::Event& event) -> std::optional<CanonicalEvent>
{
    auto const& payload = event.payload;

    if (json::getStringOr(payload, "stream", "") == "assistant")
    {
        auto const* data = json::find(payload, "data");
        auto delta = data ? json::getStringOr(*data, "delta", "") : std::string {};
        if (delta.empty())
            return std::nullopt;
        _sawTextFragment = true;
        return CanonicalEvent { .payload = TextFragment { .content = std::move(delta) }, .seq = event.seq };
    }

    if (json::find(payload, "kind"))
    {
        log::trace("Agent event kind={}", json::getStringOr(payload, "kind", "?"));
        return fromKind(event);
    }

    log::trace("Dropping agent event: keys=[{}]", payloadKeys(payload));
    return std::nullopt;
}

auto EventTranslator::translateChat(const frame::Event& event) -> std::optional<CanonicalEvent>
{
    auto const state = json::getStringOr(event.payload, "state", "");

    auto completion = [&](std::string reason) {
        return CanonicalEvent { .payload = Completion { .stopReason = std::move(reason) }, .seq = event.seq };
    };

    if (state == "final")
        return completion("end_turn");
    if (state == "error")
        return completion(json::getStringOr(event.payload, "errorMessage", "error"));
    if (state == "aborted")
        return completion("aborted");

    if (state == "delta" && !_sawTextFragment && !_warnedBatchedDelta)
    {
        _warnedBatchedDelta = true;
        log::warning("Received batched chat delta before any agent token stream; "
                     "assistant text is only taken from the agent stream");
    }
    return std::nullopt;
}

} // namespace gatelink
