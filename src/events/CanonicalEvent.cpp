// SPDX-License-Identifier: Apache-2.0
#include "CanonicalEvent.hpp"

#include <core/JsonUtils.hpp>

#include <array>
#include <format>

namespace gatelink
{

namespace
{
    constexpr auto AllKinds = std::array {
        EventKind::TextFragment, EventKind::ToolStart,  EventKind::ToolResult,
        EventKind::ContentDiff,  EventKind::Completion, EventKind::UiDescription,
    };

    auto valueOr(const nlohmann::ordered_json& obj, std::string_view key, nlohmann::ordered_json fallback)
        -> nlohmann::ordered_json
    {
        if (auto const* value = json::find(obj, key))
            return *value;
        return fallback;
    }

    struct PayloadSerializer
    {
        auto operator()(const TextFragment& e) const -> nlohmann::ordered_json
        {
            return { { "kind", "text_delta" }, { "content", e.content } };
        }

        auto operator()(const ToolStart& e) const -> nlohmann::ordered_json
        {
            auto out = nlohmann::ordered_json { { "kind", "tool_start" }, { "tool", e.tool }, { "id", e.id } };
            if (e.title)
                out["title"] = *e.title;
            out["input"] = e.input;
            return out;
        }

        auto operator()(const ToolResult& e) const -> nlohmann::ordered_json
        {
            auto out = nlohmann::ordered_json { { "kind", "tool_result" }, { "id", e.id }, { "output", e.output } };
            if (e.error)
                out["error"] = *e.error;
            return out;
        }

        auto operator()(const ContentDiff& e) const -> nlohmann::ordered_json
        {
            return {
                { "kind", "diff" },
                { "path", e.path },
                { "original", e.original ? nlohmann::ordered_json(*e.original) : nlohmann::ordered_json(nullptr) },
                { "modified", e.modified },
            };
        }

        auto operator()(const Completion& e) const -> nlohmann::ordered_json
        {
            return { { "kind", "done" }, { "stopReason", e.stopReason } };
        }

        auto operator()(const UiDescription& e) const -> nlohmann::ordered_json
        {
            return { { "kind", "a2ui" }, { "payload", e.payload } };
        }
    };
} // namespace

auto eventKindFromName(std::string_view name) -> std::optional<EventKind>
{
    for (auto const kind: AllKinds)
        if (eventKindName(kind) == name)
            return kind;
    return std::nullopt;
}

auto CanonicalEvent::toJson() const -> nlohmann::ordered_json
{
    return std::visit(PayloadSerializer {}, payload);
}

auto canonicalFromJson(const nlohmann::ordered_json& payload) -> Result<CanonicalPayload>
{
    auto const name = json::getStringOr(payload, "kind", "");
    auto const kind = eventKindFromName(name);
    if (!kind)
        return makeError(ErrorCode::ParseError, std::format("Unknown event kind '{}'", name));

    switch (*kind)
    {
        case EventKind::TextFragment:
            return TextFragment { .content = json::getStringOr(payload, "content", "") };
        case EventKind::ToolStart:
            return ToolStart {
                .tool = json::getStringOr(payload, "tool", ""),
                .id = json::getStringOr(payload, "id", ""),
                .title = json::getOptionalString(payload, "title"),
                .input = valueOr(payload, "input", nlohmann::ordered_json::object()),
            };
        case EventKind::ToolResult:
            return ToolResult {
                .id = json::getStringOr(payload, "id", ""),
                .output = valueOr(payload, "output", nullptr),
                .error = json::getOptionalString(payload, "error"),
            };
        case EventKind::ContentDiff: {
            auto modified = json::getString(payload, "modified");
            if (!modified)
                return std::unexpected(modified.error());
            return ContentDiff {
                .path = json::getStringOr(payload, "path", ""),
                .original = json::getOptionalString(payload, "original"),
                .modified = std::move(*modified),
            };
        }
        case EventKind::Completion:
            return Completion { .stopReason = json::getStringOr(payload, "stopReason", "end_turn") };
        case EventKind::UiDescription: {
            auto const* ui = json::find(payload, "payload");
            if (!ui || !ui->is_object())
                return makeError(ErrorCode::ParseError, "UI description without payload object");
            return UiDescription { .payload = *ui };
        }
    }
    return makeError(ErrorCode::ParseError, std::format("Unhandled event kind '{}'", name));
}

} // namespace gatelink
