// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <events/CanonicalEvent.hpp>
#include <protocol/Frame.hpp>

#include <optional>

namespace gatelink
{

/// @brief Normalizes gateway push events into canonical events.
///
/// The raw per-token `agent` stream is the source of assistant text; the batched `chat`
/// stream only contributes turn completion. Telemetry events are filtered out. Never
/// fails: anything that cannot be mapped is logged and dropped.
class EventTranslator
{
  public:
    /// @brief Translates one push event.
    /// @return The canonical event, or std::nullopt if the event is discarded.
    [[nodiscard]] auto translate(const frame::Event& event) -> std::optional<CanonicalEvent>;

    /// @brief Returns true once a raw per-token fragment has been translated.
    [[nodiscard]] auto sawTextFragment() const noexcept -> bool { return _sawTextFragment; }

  private:
    bool _sawTextFragment = false;
    bool _warnedBatchedDelta = false;

    auto translateAgent(const frame::Event& event) -> std::optional<CanonicalEvent>;
    auto translateChat(const frame::Event& event) -> std::optional<CanonicalEvent>;
};

} // namespace gatelink
