// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gatelink
{

/// @brief The kinds of normalized events delivered to the sinks.
enum class EventKind : std::uint8_t
{
    TextFragment,
    ToolStart,
    ToolResult,
    ContentDiff,
    Completion,
    UiDescription,
};

/// @brief Returns the wire name of an event kind (the `kind` field of agent payloads).
[[nodiscard]] constexpr auto eventKindName(EventKind kind) -> std::string_view
{
    switch (kind)
    {
        case EventKind::TextFragment: return "text_delta";
        case EventKind::ToolStart: return "tool_start";
        case EventKind::ToolResult: return "tool_result";
        case EventKind::ContentDiff: return "diff";
        case EventKind::Completion: return "done";
        case EventKind::UiDescription: return "a2ui";
    }
    return "unknown";
}

/// @brief Parses a wire kind name.
[[nodiscard]] auto eventKindFromName(std::string_view name) -> std::optional<EventKind>;

/// @brief A chunk of assistant text.
struct TextFragment
{
    std::string content;
};

/// @brief A tool invocation started.
struct ToolStart
{
    std::string tool;
    std::string id;
    std::optional<std::string> title;
    nlohmann::ordered_json input = nlohmann::ordered_json::object();
};

/// @brief A tool invocation finished.
struct ToolResult
{
    std::string id;
    nlohmann::ordered_json output;
    std::optional<std::string> error;
};

/// @brief A proposed file modification. A missing original means a new file.
struct ContentDiff
{
    std::string path;
    std::optional<std::string> original;
    std::string modified;
};

/// @brief The conversational turn ended.
struct Completion
{
    std::string stopReason;
};

/// @brief A UI description to be converted into structured operations.
struct UiDescription
{
    nlohmann::ordered_json payload;
};

using CanonicalPayload = std::variant<TextFragment, ToolStart, ToolResult, ContentDiff, Completion, UiDescription>;

/// @brief Normalized event with an optional gateway sequence number.
struct CanonicalEvent
{
    CanonicalPayload payload;
    std::optional<std::int64_t> seq;

    [[nodiscard]] auto kind() const -> EventKind { return static_cast<EventKind>(payload.index()); }

    /// @brief Serializes the event in the agent payload layout (`{kind, ...}`).
    [[nodiscard]] auto toJson() const -> nlohmann::ordered_json;
};

/// @brief Builds a canonical payload from an agent payload carrying a `kind` field.
/// @param payload The agent payload object.
/// @return The payload, or a ParseError if the kind is unknown or required fields are missing.
[[nodiscard]] auto canonicalFromJson(const nlohmann::ordered_json& payload) -> Result<CanonicalPayload>;

} // namespace gatelink
