// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace gatelink
{

/// @brief Identifies a scheduled timer. Zero is never a valid id.
using TimerId = std::uint64_t;

/// @brief Cooperative one-shot timer service shared by frame handling and session timers.
///
/// Callbacks run on the same thread that processes transport frames, so a session
/// never observes a timer concurrently with a frame.
class Scheduler
{
  public:
    virtual ~Scheduler() = default;

    /// @brief Schedules a callback to run once after the given delay.
    /// @param delay Time until the callback fires.
    /// @param callback The function to run.
    /// @return Id that can be passed to cancel().
    [[nodiscard]] virtual auto schedule(std::chrono::milliseconds delay, std::function<void()> callback)
        -> TimerId = 0;

    /// @brief Cancels a pending timer. Unknown or already fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

} // namespace gatelink
