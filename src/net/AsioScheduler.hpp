// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Scheduler.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <map>
#include <memory>

namespace gatelink
{

/// @brief Scheduler backed by steady timers of a Boost.Asio io_context.
///
/// Callbacks run on the thread(s) driving the io_context.
class AsioScheduler final: public Scheduler
{
  public:
    explicit AsioScheduler(boost::asio::io_context& io);
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    [[nodiscard]] auto schedule(std::chrono::milliseconds delay, std::function<void()> callback) -> TimerId override;
    void cancel(TimerId id) override;

    [[nodiscard]] auto pendingCount() const noexcept -> std::size_t { return _timers.size(); }

  private:
    boost::asio::io_context& _io;
    TimerId _nextId = 1;
    std::map<TimerId, std::shared_ptr<boost::asio::steady_timer>> _timers;
};

} // namespace gatelink
