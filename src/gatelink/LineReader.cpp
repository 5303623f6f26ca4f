// SPDX-License-Identifier: Apache-2.0
#include "LineReader.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace gatelink
{

namespace
{
    constexpr auto PollIntervalMs = 100;
} // namespace

LineReader::LineReader(int fd, LineHandler onLine, EndHandler onEnd):
    _fd(fd), _onLine(std::move(onLine)), _onEnd(std::move(onEnd))
{
}

LineReader::~LineReader()
{
    stop();
}

void LineReader::start()
{
    if (_thread.joinable())
        return;
    _stopRequested = false;
    _thread = std::thread([this]() { run(); });
}

void LineReader::stop()
{
    _stopRequested = true;
    if (_thread.joinable())
        _thread.join();
}

void LineReader::run()
{
    auto pending = std::string {};
    auto buffer = std::array<char, 4096> {};

    while (!_stopRequested)
    {
        auto pfd = pollfd { .fd = _fd, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, PollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            log::error("Cannot poll input: {}", std::strerror(errno));
            break;
        }
        if (ready == 0)
            continue;

        auto const count = ::read(_fd, buffer.data(), buffer.size());
        if (count < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            log::error("Cannot read input: {}", std::strerror(errno));
            break;
        }
        if (count == 0)
            break;

        pending.append(buffer.data(), static_cast<std::size_t>(count));
        for (auto newline = pending.find('\n'); newline != std::string::npos; newline = pending.find('\n'))
        {
            auto line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (_onLine)
                _onLine(std::move(line));
        }
    }

    if (_stopRequested)
        return;

    // Input ended without a trailing newline.
    if (!pending.empty() && _onLine)
        _onLine(std::move(pending));

    _finished = true;
    if (_onEnd)
        _onEnd();
}

} // namespace gatelink
