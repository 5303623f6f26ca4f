// SPDX-License-Identifier: Apache-2.0
#include "AsioScheduler.hpp"

#include <boost/system/error_code.hpp>

namespace gatelink
{

AsioScheduler::AsioScheduler(boost::asio::io_context& io): _io(io)
{
}

AsioScheduler::~AsioScheduler()
{
    for (auto& [id, timer]: _timers)
        timer->cancel();
    _timers.clear();
}

auto AsioScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> callback) -> TimerId
{
    auto const id = _nextId++;
    auto timer = std::make_shared<boost::asio::steady_timer>(_io, delay);
    _timers.emplace(id, timer);

    timer->async_wait([this, id, timer, callback = std::move(callback)](const boost::system::error_code& ec) {
        if (ec)
            return;
        // A cancelled timer whose expiry already queued this handler is no longer in the map.
        if (_timers.erase(id) == 0)
            return;
        callback();
    });
    return id;
}

void AsioScheduler::cancel(TimerId id)
{
    auto const it = _timers.find(id);
    if (it == _timers.end())
        return;
    it->second->cancel();
    _timers.erase(it);
}

} // namespace gatelink
