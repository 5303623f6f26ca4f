// SPDX-License-Identifier: Apache-2.0
#include "EventRouter.hpp"

#include <canvas/UiGraphConverter.hpp>
#include <core/Log.hpp>

#include <variant>

namespace gatelink
{

namespace
{
    constexpr auto routerLog = log::Channel { "router" };
} // namespace

EventRouter::EventRouter(ConversationSink& conversation, RenderingSink& rendering, EditorSink& editor):
    _conversation(conversation), _rendering(rendering), _editor(editor)
{
}

void EventRouter::route(const CanonicalEvent& event)
{
    if (event.seq)
    {
        if (_watermark && *event.seq <= *_watermark)
        {
            routerLog.debug("Dropped seq={} (watermark={}) kind={}",
                            *event.seq,
                            *_watermark,
                            eventKindName(event.kind()));
            return;
        }
        _watermark = event.seq;
    }

    if (auto const* diff = std::get_if<ContentDiff>(&event.payload))
    {
        _conversation.postEvent(event);
        _editor.showDiff(diff->original.value_or(""), diff->modified, diff->path);
        return;
    }

    if (auto const* ui = std::get_if<UiDescription>(&event.payload))
    {
        auto operations = canvas::convertEach({ ui->payload });
        if (operations.empty())
        {
            routerLog.warning("UI description produced no operations");
            return;
        }
        _rendering.postStructuredOperations(operations);
        return;
    }

    _conversation.postEvent(event);
}

} // namespace gatelink
