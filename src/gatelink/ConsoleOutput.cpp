// SPDX-License-Identifier: Apache-2.0
#include "ConsoleOutput.hpp"

#include <core/JsonUtils.hpp>

#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <string_view>
#include <type_traits>
#include <variant>

namespace gatelink
{

namespace
{
    // Style helpers for terminal output
    constexpr auto Gray = std::string_view { "\033[90m" };
    constexpr auto Cyan = std::string_view { "\033[36m" };
    constexpr auto Red = std::string_view { "\033[31m" };
    constexpr auto Green = std::string_view { "\033[32m" };
    constexpr auto Reset = std::string_view { "\033[0m" };

    auto splitLines(std::string_view text) -> std::vector<std::string_view>
    {
        auto lines = std::vector<std::string_view> {};
        while (!text.empty())
        {
            auto const end = text.find('\n');
            lines.push_back(text.substr(0, end));
            if (end == std::string_view::npos)
                break;
            text.remove_prefix(end + 1);
        }
        return lines;
    }

    /// Returns the literal text of a wrapped component property, if any.
    auto literalText(const nlohmann::ordered_json& props) -> std::optional<std::string>
    {
        auto const* text = json::find(props, "text");
        if (!text)
            return std::nullopt;
        return json::getOptionalString(*text, "literalString");
    }

    auto describeComponent(const nlohmann::ordered_json& entry) -> std::string
    {
        auto const id = json::getStringOr(entry, "id", "?");
        auto const* component = json::find(entry, "component");
        if (!component || !component->is_object() || component->empty())
            return std::format("  {} (empty)", id);

        auto const it = component->begin();
        if (auto const text = literalText(it.value()))
        {
            auto const firstLine = std::string_view(*text).substr(0, std::string_view(*text).find('\n'));
            return std::format("  {} {} \"{}\"", id, it.key(), firstLine);
        }
        return std::format("  {} {}", id, it.key());
    }
} // namespace

auto describeOperation(const nlohmann::ordered_json& operation) -> std::vector<std::string>
{
    auto lines = std::vector<std::string> {};

    if (auto const* update = json::find(operation, "surfaceUpdate"))
    {
        lines.push_back(std::format("[canvas:{}] update", json::getStringOr(*update, "surfaceId", "?")));
        if (auto const* components = json::find(*update, "components"); components && components->is_array())
        {
            for (auto const& entry: *components)
                lines.push_back(describeComponent(entry));
        }
    }
    else if (auto const* begin = json::find(operation, "beginRendering"))
        lines.push_back(std::format("[canvas:{}] render root={}",
                                    json::getStringOr(*begin, "surfaceId", "?"),
                                    json::getStringOr(*begin, "root", "?")));
    else if (auto const* data = json::find(operation, "dataModelUpdate"))
        lines.push_back(std::format("[canvas:{}] data model update", json::getStringOr(*data, "surfaceId", "?")));
    else if (auto const* removed = json::find(operation, "deleteSurface"))
        lines.push_back(std::format("[canvas:{}] deleted", json::getStringOr(*removed, "surfaceId", "?")));
    else
        lines.push_back(std::format("[canvas] {}", operation.dump()));

    return lines;
}

void ConsoleOutput::postEvent(const CanonicalEvent& event)
{
    std::visit(
        [this](auto const& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, TextFragment>)
            {
                std::print("{}", payload.content);
                std::fflush(stdout);
                _midLine = !payload.content.empty() && payload.content.back() != '\n';
            }
            else if constexpr (std::is_same_v<T, ToolStart>)
            {
                endLine();
                std::println("{}⚙ {}{}", Cyan, payload.title.value_or(payload.tool), Reset);
            }
            else if constexpr (std::is_same_v<T, ToolResult>)
            {
                endLine();
                if (payload.error)
                    std::println("{}✗ #{}: {}{}", Red, payload.id, *payload.error, Reset);
                else
                    std::println("{}✓ #{}{}", Gray, payload.id, Reset);
            }
            else if constexpr (std::is_same_v<T, ContentDiff>)
            {
                endLine();
                std::println("{}~ {}{}", Cyan, payload.path, Reset);
            }
            else if constexpr (std::is_same_v<T, Completion>)
            {
                endLine();
                if (payload.stopReason != "end_turn")
                    std::println("{}[{}]{}", Gray, payload.stopReason, Reset);
            }
            else if constexpr (std::is_same_v<T, UiDescription>)
            {
                endLine();
                std::println("{}[ui] {}{}", Gray, payload.payload.dump(), Reset);
            }
        },
        event.payload);
}

void ConsoleOutput::postStructuredOperations(const std::vector<nlohmann::ordered_json>& operations)
{
    endLine();
    for (auto const& operation: operations)
    {
        for (auto const& line: describeOperation(operation))
            std::println("{}{}{}", Green, line, Reset);
    }
}

void ConsoleOutput::showDiff(std::string_view original, std::string_view modified, std::string_view title)
{
    endLine();
    std::println("{}--- {}{}", Red, title, Reset);
    std::println("{}+++ {}{}", Green, title, Reset);
    for (auto const line: splitLines(original))
        std::println("{}-{}{}", Red, line, Reset);
    for (auto const line: splitLines(modified))
        std::println("{}+{}{}", Green, line, Reset);
}

void ConsoleOutput::notice(std::string_view text)
{
    endLine();
    std::println("{}{}{}", Gray, text, Reset);
}

void ConsoleOutput::endLine()
{
    if (!_midLine)
        return;
    std::print("\n");
    _midLine = false;
}

} // namespace gatelink
