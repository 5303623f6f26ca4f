// SPDX-License-Identifier: Apache-2.0
#include "UiGraphConverter.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <iterator>
#include <optional>
#include <span>
#include <variant>

namespace gatelink::canvas
{

namespace
{
    constexpr auto canvasLog = log::Channel { "canvas" };

    // {{{ field aliases

    enum class Alias : std::uint8_t
    {
        SurfaceId,
        ComponentList,
        SingleComponent,
        MetaTitle,
        Code,
        Language,
        ColumnLabel,
    };

    constexpr auto SurfaceIdPaths = std::array<std::string_view, 3> { "id", "surface.id", "surfaceId" };
    constexpr auto ComponentListPaths = std::array<std::string_view, 2> { "components", "surface.components" };
    constexpr auto SingleComponentPaths = std::array<std::string_view, 4> { "component", "content", "body", "ui" };
    constexpr auto MetaTitlePaths = std::array<std::string_view, 3> { "title", "text", "label" };
    constexpr auto CodePaths = std::array<std::string_view, 3> { "code", "content", "text" };
    constexpr auto LanguagePaths = std::array<std::string_view, 2> { "language", "lang" };
    constexpr auto ColumnLabelPaths = std::array<std::string_view, 5> { "label", "title", "header", "name", "key" };

    auto aliasPaths(Alias alias) -> std::span<const std::string_view>
    {
        switch (alias)
        {
            case Alias::SurfaceId: return SurfaceIdPaths;
            case Alias::ComponentList: return ComponentListPaths;
            case Alias::SingleComponent: return SingleComponentPaths;
            case Alias::MetaTitle: return MetaTitlePaths;
            case Alias::Code: return CodePaths;
            case Alias::Language: return LanguagePaths;
            case Alias::ColumnLabel: return ColumnLabelPaths;
        }
        return {};
    }

    /// Follows a dotted path ("surface.id") through nested objects.
    auto findPath(const nlohmann::ordered_json& obj, std::string_view path) -> const nlohmann::ordered_json*
    {
        auto const* current = &obj;
        while (current)
        {
            auto const dot = path.find('.');
            current = json::find(*current, path.substr(0, dot));
            if (dot == std::string_view::npos)
                break;
            path.remove_prefix(dot + 1);
        }
        return current;
    }

    /// Returns the first non-null value among the aliases that satisfies @p accept.
    template <typename Predicate>
    auto resolve(const nlohmann::ordered_json& obj, Alias alias, Predicate accept) -> const nlohmann::ordered_json*
    {
        for (auto const path: aliasPaths(alias))
        {
            auto const* value = findPath(obj, path);
            if (value && !value->is_null() && accept(*value))
                return value;
        }
        return nullptr;
    }

    auto resolve(const nlohmann::ordered_json& obj, Alias alias) -> const nlohmann::ordered_json*
    {
        return resolve(obj, alias, [](const nlohmann::ordered_json&) { return true; });
    }

    // }}}

    // {{{ helpers

    auto stringify(const nlohmann::ordered_json& value) -> std::string
    {
        if (value.is_null())
            return {};
        if (value.is_string())
            return value.get<std::string>();
        if (value.is_boolean())
            return value.get<bool>() ? "true" : "false";
        if (value.is_number_integer())
            return value.dump();
        if (value.is_number_float())
        {
            auto const number = value.get<double>();
            if (std::isfinite(number) && number == std::floor(number) && std::abs(number) < 1e15)
                return std::format("{}", static_cast<std::int64_t>(number));
            return std::format("{}", number);
        }
        return value.dump();
    }

    auto stringOf(const nlohmann::ordered_json& obj, std::string_view key) -> std::string
    {
        auto const* value = json::find(obj, key);
        return value ? stringify(*value) : std::string {};
    }

    /// Reads a number, also accepting its decimal string form ("50", " 2.5 ").
    auto numberOr(const nlohmann::ordered_json& obj, std::string_view key, double fallback) -> double
    {
        auto const* value = json::find(obj, key);
        if (!value)
            return fallback;
        if (value->is_number())
            return value->get<double>();
        if (!value->is_string())
            return fallback;

        auto const& text = value->get_ref<const std::string&>();
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return fallback;
        auto const last = text.find_last_not_of(" \t\r\n");

        auto const* begin = text.data() + first;
        auto const* end = text.data() + last + 1;
        auto number = 0.0;
        auto const [ptr, ec] = std::from_chars(begin, end, number);
        if (ec != std::errc {} || ptr != end || !std::isfinite(number))
            return fallback;
        return number;
    }

    auto capitalize(std::string name) -> std::string
    {
        if (name.empty())
            return "Text";
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
        return name;
    }

    auto joinCells(const std::vector<std::string>& cells) -> std::string
    {
        auto text = std::string {};
        for (auto i = std::size_t { 0 }; i < cells.size(); ++i)
        {
            if (i > 0)
                text += " │ ";
            text += cells[i];
        }
        return text;
    }

    auto repeat(std::string_view glyph, int count) -> std::string
    {
        auto out = std::string {};
        for (auto i = 0; i < count; ++i)
            out += glyph;
        return out;
    }

    auto objectKeys(const nlohmann::ordered_json& value) -> std::string
    {
        if (!value.is_object())
            return std::string(value.type_name());
        auto keys = std::string {};
        for (auto const& [key, _]: value.items())
            keys += keys.empty() ? key : "," + key;
        return keys;
    }

    // }}}

    // {{{ component construction

    struct Extracted
    {
        std::vector<nlohmann::ordered_json> components;
        std::string rootId;
    };

    auto makeComponent(std::string_view id,
                       std::string_view typeName,
                       const nlohmann::ordered_json& props,
                       const std::vector<std::string>& childIds = {}) -> nlohmann::ordered_json
    {
        auto wrapped = nlohmann::ordered_json::object();
        if (props.is_object())
        {
            for (auto const& [key, value]: props.items())
            {
                if (key == "type" || key == "id" || key == "children")
                    continue;
                wrapped[key] = wrapValue(value);
            }
        }
        if (!childIds.empty())
            wrapped["children"] = { { "explicitList", childIds } };

        return nlohmann::ordered_json {
            { "id", id },
            { "component", { { std::string(typeName), std::move(wrapped) } } },
        };
    }

    auto textComponent(std::string_view id, std::string_view text, std::string_view usageHint) -> nlohmann::ordered_json
    {
        return makeComponent(id, "Text", { { "text", text }, { "usageHint", usageHint } });
    }

    auto tableToComponents(const nlohmann::ordered_json& node, const std::string& id, IdAllocator& ids) -> Extracted
    {
        auto result = Extracted { .components = {}, .rootId = id };
        auto rowIds = std::vector<std::string> {};

        auto const* columnsValue = json::find(node, "columns");
        auto const columns = columnsValue && columnsValue->is_array() ? *columnsValue : nlohmann::ordered_json::array();

        auto labels = std::vector<std::string> {};
        for (auto const& column: columns)
        {
            if (column.is_object())
            {
                auto const* label = resolve(column, Alias::ColumnLabel);
                labels.push_back(label ? stringify(*label) : std::string {});
            }
            else
                labels.push_back(stringify(column));
        }

        if (!labels.empty())
        {
            auto headerId = ids.next("hdr");
            result.components.push_back(textComponent(headerId, joinCells(labels), "h3"));
            rowIds.push_back(std::move(headerId));

            auto dividerId = ids.next("div");
            result.components.push_back(makeComponent(dividerId, "Divider", nlohmann::ordered_json::object()));
            rowIds.push_back(std::move(dividerId));
        }

        // Object rows are looked up by column key only when the columns are declared as objects.
        auto const keyedColumns = !columns.empty() && columns.front().is_object();

        auto const* rowsValue = json::find(node, "rows");
        if (rowsValue && rowsValue->is_array())
        {
            for (auto const& row: *rowsValue)
            {
                auto rowId = ids.next("row");
                auto cells = std::vector<std::string> {};
                if (row.is_array())
                {
                    for (auto const& cell: row)
                        cells.push_back(stringify(cell));
                }
                else if (row.is_object() && keyedColumns)
                {
                    for (auto const& column: columns)
                        cells.push_back(stringOf(row, stringOf(column, "key")));
                }
                else if (row.is_object())
                {
                    for (auto const& [key, cell]: row.items())
                        cells.push_back(stringify(cell));
                }
                else
                    cells.push_back(stringify(row));

                result.components.push_back(textComponent(rowId, joinCells(cells), "body"));
                rowIds.push_back(std::move(rowId));
            }
        }

        result.components.push_back(makeComponent(id, "Column", nlohmann::ordered_json::object(), rowIds));
        return result;
    }

    auto progressToComponents(const nlohmann::ordered_json& node, const std::string& id) -> Extracted
    {
        constexpr auto BarWidth = 20;

        auto const value = numberOr(node, "value", 0.0);
        auto const max = numberOr(node, "max", 100.0);
        auto const ratio = max > 0.0 ? std::clamp(value / max, 0.0, 1.0) : 0.0;
        auto const pct = static_cast<int>(std::floor(ratio * 100.0 + 0.5));
        auto const filled = std::clamp(static_cast<int>(std::floor(pct / 5.0 + 0.5)), 0, BarWidth);

        auto label = stringOf(node, "label");
        if (label.empty())
            label = std::format("{}%", pct);

        auto const text = std::format("{}\n{}{}", label, repeat("█", filled), repeat("░", BarWidth - filled));
        return Extracted { .components = { textComponent(id, text, "body") }, .rootId = id };
    }

    auto codeBlockToComponents(const nlohmann::ordered_json& node, const std::string& id) -> Extracted
    {
        auto const* codeValue = resolve(node, Alias::Code);
        auto const* languageValue = resolve(node, Alias::Language);
        auto const code = codeValue ? stringify(*codeValue) : std::string {};
        auto const language = languageValue ? stringify(*languageValue) : std::string {};
        auto const filename = stringOf(node, "filename");

        auto label = std::string {};
        if (!filename.empty())
            label = filename;
        else if (!language.empty())
            label = std::format("[{}]", language);

        auto const text = label.empty() ? code : std::format("{}\n{}", label, code);
        return Extracted { .components = { textComponent(id, text, "body") }, .rootId = id };
    }

    /// Converts a freeform node and its subtree. The node id is allocated before the
    /// ids of its children.
    auto extractComponents(const nlohmann::ordered_json& node, IdAllocator& ids) -> Extracted
    {
        auto const* ownId = json::find(node, "id");
        auto const id = ownId && !ownId->is_null() ? stringify(*ownId) : ids.next("c");

        auto const typeName = capitalize(json::getStringOr(node, "type", "Text"));

        auto result = Extracted {};
        auto childIds = std::vector<std::string> {};
        if (auto const* children = json::find(node, "children"); children && children->is_array())
        {
            for (auto const& child: *children)
            {
                if (!child.is_object())
                    continue;
                auto sub = extractComponents(child, ids);
                std::ranges::move(sub.components, std::back_inserter(result.components));
                childIds.push_back(std::move(sub.rootId));
            }
        }

        auto mapped = Extracted {};
        if (typeName == "Table")
            mapped = tableToComponents(node, id, ids);
        else if (typeName == "Progress")
            mapped = progressToComponents(node, id);
        else if (typeName == "Codeblock" || typeName == "CodeBlock")
            mapped = codeBlockToComponents(node, id);
        else
            mapped = Extracted { .components = { makeComponent(id, typeName, node, childIds) }, .rootId = id };

        std::ranges::move(mapped.components, std::back_inserter(result.components));
        result.rootId = std::move(mapped.rootId);
        return result;
    }

    auto surfaceOperations(std::string_view surfaceId,
                           std::vector<nlohmann::ordered_json> components,
                           std::string_view rootId)
        -> std::vector<nlohmann::ordered_json>
    {
        return {
            { { "surfaceUpdate", { { "surfaceId", surfaceId }, { "components", std::move(components) } } } },
            { { "beginRendering", { { "surfaceId", surfaceId }, { "root", rootId } } } },
        };
    }

    // }}}

    // {{{ message shapes

    struct StructuredOperation
    {
        nlohmann::ordered_json operation;
    };

    struct CreateSurface
    {
        std::string surfaceId;
        std::vector<nlohmann::ordered_json> components;
    };

    struct FreeformComponent
    {
        nlohmann::ordered_json node;
    };

    /// A page/header/title object; only carries the batch title.
    struct MetaTitle
    {
        nlohmann::ordered_json node;
        std::optional<std::string> title;
    };

    struct Unrecognized
    {
        nlohmann::ordered_json value;
    };

    using Message = std::variant<StructuredOperation, CreateSurface, FreeformComponent, MetaTitle, Unrecognized>;

    auto parseCreateSurface(const nlohmann::ordered_json& message) -> CreateSurface
    {
        auto const* wrapper = json::find(message, "createSurface");
        auto const& body = wrapper && wrapper->is_object() ? *wrapper : message;

        auto const* surfaceId = resolve(body, Alias::SurfaceId);
        auto result = CreateSurface {
            .surfaceId = surfaceId ? stringify(*surfaceId) : std::string(DefaultSurfaceId),
            .components = {},
        };

        if (auto const* list = resolve(body, Alias::ComponentList, [](auto const& v) { return v.is_array(); }))
        {
            for (auto const& component: *list)
                result.components.push_back(component);
        }
        else if (auto const* single =
                     resolve(body, Alias::SingleComponent, [](auto const& v) { return v.is_object(); }))
        {
            result.components.push_back(*single);
        }
        return result;
    }

    auto classify(const nlohmann::ordered_json& message) -> Message
    {
        if (!message.is_object())
            return Unrecognized { message };

        if (isStructuredOperation(message))
            return StructuredOperation { message };

        auto const type = json::getOptionalString(message, "type");
        auto const* wrapper = json::find(message, "createSurface");
        auto const hasWrapper = wrapper && !wrapper->is_null() && *wrapper != false;
        if (type == "createSurface" || hasWrapper)
            return parseCreateSurface(message);

        if (!type || *type == "event" || *type == "res" || *type == "req")
            return Unrecognized { message };

        if (*type == "page" || *type == "header" || *type == "title")
        {
            auto const* title = resolve(message, Alias::MetaTitle);
            return MetaTitle {
                .node = message,
                .title = title ? std::optional { stringify(*title) } : std::nullopt,
            };
        }

        return FreeformComponent { message };
    }

    auto isSurfaceLevel(const Message& message) -> bool
    {
        return std::holds_alternative<StructuredOperation>(message) || std::holds_alternative<CreateSurface>(message);
    }

    auto convertCreateSurface(const CreateSurface& surface, IdAllocator& ids) -> std::vector<nlohmann::ordered_json>
    {
        auto components = std::vector<nlohmann::ordered_json> {};
        auto topLevelIds = std::vector<std::string> {};
        for (auto const& raw: surface.components)
        {
            if (!raw.is_object())
                continue;
            auto extracted = extractComponents(raw, ids);
            std::ranges::move(extracted.components, std::back_inserter(components));
            topLevelIds.push_back(std::move(extracted.rootId));
        }

        if (topLevelIds.empty())
        {
            canvasLog.warning("createSurface '{}' carries no components, skipping", surface.surfaceId);
            return {};
        }

        auto rootId = std::string {};
        if (topLevelIds.size() == 1)
            rootId = topLevelIds.front();
        else
        {
            rootId = ids.next("root");
            components.push_back(makeComponent(rootId, "Column", nlohmann::ordered_json::object(), topLevelIds));
        }
        return surfaceOperations(surface.surfaceId, std::move(components), rootId);
    }

    auto convertBare(const nlohmann::ordered_json& node, IdAllocator& ids) -> std::vector<nlohmann::ordered_json>
    {
        auto extracted = extractComponents(node, ids);
        auto rootId = ids.next("root");
        extracted.components.push_back(
            makeComponent(rootId, "Column", nlohmann::ordered_json::object(), { extracted.rootId }));
        return surfaceOperations(DefaultSurfaceId, std::move(extracted.components), rootId);
    }

    struct MessageConverter
    {
        IdAllocator& ids;

        auto operator()(const StructuredOperation& m) const -> std::vector<nlohmann::ordered_json>
        {
            return { m.operation };
        }

        auto operator()(const CreateSurface& m) const -> std::vector<nlohmann::ordered_json>
        {
            return convertCreateSurface(m, ids);
        }

        auto operator()(const FreeformComponent& m) const -> std::vector<nlohmann::ordered_json>
        {
            return convertBare(m.node, ids);
        }

        auto operator()(const MetaTitle& m) const -> std::vector<nlohmann::ordered_json>
        {
            return convertBare(m.node, ids);
        }

        auto operator()(const Unrecognized& m) const -> std::vector<nlohmann::ordered_json>
        {
            canvasLog.warning("Skipping unknown UI message format, keys={}", objectKeys(m.value));
            return {};
        }
    };

    auto convertMessages(const std::vector<Message>& messages, IdAllocator& ids) -> std::vector<nlohmann::ordered_json>
    {
        auto result = std::vector<nlohmann::ordered_json> {};
        for (auto const& message: messages)
            std::ranges::move(std::visit(MessageConverter { ids }, message), std::back_inserter(result));
        return result;
    }

    /// Merges bare components into one titled surface.
    auto convertPage(const std::vector<Message>& messages, IdAllocator& ids) -> std::vector<nlohmann::ordered_json>
    {
        auto title = std::string { "Canvas" };
        auto components = std::vector<nlohmann::ordered_json> {};
        auto topLevelIds = std::vector<std::string> {};

        for (auto const& message: messages)
        {
            auto const* node = static_cast<const nlohmann::ordered_json*>(nullptr);
            if (auto const* meta = std::get_if<MetaTitle>(&message))
            {
                if (meta->title)
                    title = *meta->title;
                continue;
            }
            if (auto const* bare = std::get_if<FreeformComponent>(&message))
                node = &bare->node;
            else if (auto const* other = std::get_if<Unrecognized>(&message); other && other->value.is_object())
                node = &other->value;

            if (!node)
            {
                canvasLog.warning("Skipping non-object UI message");
                continue;
            }

            auto extracted = extractComponents(*node, ids);
            std::ranges::move(extracted.components, std::back_inserter(components));
            topLevelIds.push_back(std::move(extracted.rootId));
        }

        if (topLevelIds.empty())
            return {};

        auto titleId = ids.next("title");
        components.push_back(textComponent(titleId, title, "h1"));

        auto rootId = ids.next("root");
        topLevelIds.insert(topLevelIds.begin(), std::move(titleId));
        components.push_back(makeComponent(rootId, "Column", nlohmann::ordered_json::object(), topLevelIds));

        return surfaceOperations(DefaultSurfaceId, std::move(components), rootId);
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        while (!text.empty() && isSpace(text.front()))
            text.remove_prefix(1);
        while (!text.empty() && isSpace(text.back()))
            text.remove_suffix(1);
        return text;
    }

    // }}}
} // namespace

auto IdAllocator::next(std::string_view prefix) -> std::string
{
    return std::format("{}_{}", prefix, ++_counter);
}

auto wrapValue(const nlohmann::ordered_json& value) -> nlohmann::ordered_json
{
    if (value.is_null())
        return { { "literalString", "" } };
    if (value.is_string())
        return { { "literalString", value } };
    if (value.is_number())
        return { { "literalNumber", value } };
    if (value.is_boolean())
        return { { "literalBoolean", value } };
    return value;
}

auto isStructuredOperation(const nlohmann::ordered_json& message) -> bool
{
    constexpr auto OperationKeys =
        std::array<std::string_view, 4> { "surfaceUpdate", "beginRendering", "dataModelUpdate", "deleteSurface" };

    return message.is_object() && std::ranges::any_of(OperationKeys, [&](std::string_view key) {
               return json::find(message, key) != nullptr;
           });
}

auto convertBatch(const std::vector<nlohmann::ordered_json>& messages) -> std::vector<nlohmann::ordered_json>
{
    if (messages.empty())
        return {};

    if (std::ranges::all_of(messages, [](auto const& m) { return isStructuredOperation(m); }))
        return messages;

    auto parsed = std::vector<Message> {};
    parsed.reserve(messages.size());
    for (auto const& message: messages)
        parsed.push_back(classify(message));

    auto ids = IdAllocator {};
    if (std::ranges::any_of(parsed, isSurfaceLevel))
        return convertMessages(parsed, ids);

    return convertPage(parsed, ids);
}

auto convertEach(const std::vector<nlohmann::ordered_json>& messages) -> std::vector<nlohmann::ordered_json>
{
    auto parsed = std::vector<Message> {};
    parsed.reserve(messages.size());
    for (auto const& message: messages)
        parsed.push_back(classify(message));

    auto ids = IdAllocator {};
    return convertMessages(parsed, ids);
}

auto convertJsonl(std::string_view text) -> std::vector<nlohmann::ordered_json>
{
    auto messages = std::vector<nlohmann::ordered_json> {};
    while (!text.empty())
    {
        auto const eol = text.find('\n');
        auto const line = trim(text.substr(0, eol));
        text = eol == std::string_view::npos ? std::string_view {} : text.substr(eol + 1);
        if (line.empty())
            continue;

        auto parsed = json::parse(line);
        if (!parsed)
        {
            canvasLog.warning("Failed to parse JSONL line: {}", line.substr(0, 200));
            continue;
        }
        messages.push_back(std::move(*parsed));
    }

    return convertBatch(messages);
}

} // namespace gatelink::canvas
