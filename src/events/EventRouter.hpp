// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <events/CanonicalEvent.hpp>
#include <events/Sinks.hpp>

#include <cstdint>
#include <optional>

namespace gatelink
{

/// @brief Gates canonical events by sequence number and dispatches them to the sinks.
///
/// All event kinds share one sequence space. Each router keeps its own watermark.
class EventRouter
{
  public:
    /// @param conversation Receives text, tool, completion and diff events.
    /// @param rendering Receives structured operations converted from UI descriptions.
    /// @param editor Receives diffs for side-by-side presentation.
    EventRouter(ConversationSink& conversation, RenderingSink& rendering, EditorSink& editor);

    /// @brief Routes one event. Duplicate or out-of-order events are dropped.
    void route(const CanonicalEvent& event);

    /// @brief Forgets the watermark so numbering may restart (e.g. for a new run).
    void resetSequence() noexcept { _watermark.reset(); }

    [[nodiscard]] auto watermark() const noexcept -> std::optional<std::int64_t> { return _watermark; }

  private:
    ConversationSink& _conversation;
    RenderingSink& _rendering;
    EditorSink& _editor;
    std::optional<std::int64_t> _watermark;
};

} // namespace gatelink
