// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <events/CanonicalEvent.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace gatelink
{

/// @brief Receives conversational events (text, tool activity, diffs, completions).
class ConversationSink
{
  public:
    virtual ~ConversationSink() = default;

    virtual void postEvent(const CanonicalEvent& event) = 0;
};

/// @brief Receives structured UI operations for the canvas surfaces.
class RenderingSink
{
  public:
    virtual ~RenderingSink() = default;

    /// @brief Applies one batch of structured operations in order.
    virtual void postStructuredOperations(const std::vector<nlohmann::ordered_json>& operations) = 0;
};

/// @brief Presents proposed file modifications in an editor.
class EditorSink
{
  public:
    virtual ~EditorSink() = default;

    virtual void showDiff(std::string_view original, std::string_view modified, std::string_view title) = 0;
};

} // namespace gatelink
