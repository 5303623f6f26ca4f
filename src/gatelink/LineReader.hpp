// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace gatelink
{

/// @brief Reads newline separated lines from a file descriptor on a background thread.
///
/// The thread polls the descriptor with a short timeout, so stop() always returns even while
/// no input arrives. Handlers run on the reader thread.
class LineReader
{
  public:
    using LineHandler = std::function<void(std::string line)>;
    using EndHandler = std::function<void()>;

    LineReader(int fd, LineHandler onLine, EndHandler onEnd);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    void start();

    /// @brief Stops and joins the reader thread. The end handler is not called for a stop.
    void stop();

    /// @brief Returns true once the descriptor reached end of input or failed.
    [[nodiscard]] auto finished() const noexcept -> bool { return _finished; }

  private:
    void run();

    int _fd;
    LineHandler _onLine;
    EndHandler _onEnd;
    std::atomic<bool> _stopRequested = false;
    std::atomic<bool> _finished = false;
    std::thread _thread;
};

} // namespace gatelink
