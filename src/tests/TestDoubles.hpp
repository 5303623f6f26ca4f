// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Scheduler.hpp>
#include <events/Sinks.hpp>
#include <gateway/Transport.hpp>
#include <protocol/Frame.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gatelink::test
{

/// @brief Scheduler with a virtual clock driven by advance().
class ManualScheduler final: public Scheduler
{
  public:
    auto schedule(std::chrono::milliseconds delay, std::function<void()> callback) -> TimerId override
    {
        auto const id = _nextId++;
        _timers.emplace(id, Timer { .due = _now + delay, .callback = std::move(callback) });
        return id;
    }

    void cancel(TimerId id) override { _timers.erase(id); }

    /// @brief Moves the clock forward, firing due timers in deadline order.
    void advance(std::chrono::milliseconds duration)
    {
        auto const target = _now + duration;
        while (true)
        {
            auto const next = std::ranges::min_element(
                _timers, [](auto const& a, auto const& b) { return a.second.due < b.second.due; });
            if (next == _timers.end() || next->second.due > target)
                break;

            _now = next->second.due;
            auto callback = std::move(next->second.callback);
            _timers.erase(next);
            callback();
        }
        _now = target;
    }

    [[nodiscard]] auto pendingCount() const -> std::size_t { return _timers.size(); }
    [[nodiscard]] auto now() const -> std::chrono::milliseconds { return _now; }

  private:
    struct Timer
    {
        std::chrono::milliseconds due;
        std::function<void()> callback;
    };

    std::chrono::milliseconds _now { 0 };
    TimerId _nextId = 1;
    std::map<TimerId, Timer> _timers;
};

/// @brief Shared state of one mock connection, observed and driven by the test.
struct MockConnection
{
    std::string url;
    TransportHandler handler;
    std::vector<std::string> sent;
    int pings = 0;
    bool open = false;
    bool closed = false;
    bool terminated = false;

    /// @brief Completes the connection as the remote side would.
    void accept()
    {
        open = true;
        auto onOpen = handler.onOpen;
        if (onOpen)
            onOpen();
    }

    void receive(const nlohmann::ordered_json& message)
    {
        auto onMessage = handler.onMessage;
        if (onMessage)
            onMessage(message.dump());
    }

    void receiveText(std::string_view text)
    {
        auto onMessage = handler.onMessage;
        if (onMessage)
            onMessage(text);
    }

    void pong()
    {
        auto onPong = handler.onPong;
        if (onPong)
            onPong();
    }

    void fail(std::string message)
    {
        open = false;
        auto onError = handler.onError;
        if (onError)
            onError(Error { ErrorCode::TransportError, std::move(message) });
    }

    void remoteClose()
    {
        open = false;
        auto onClose = handler.onClose;
        if (onClose)
            onClose();
    }

    [[nodiscard]] auto sentFrame(std::size_t index) const -> nlohmann::ordered_json
    {
        return nlohmann::ordered_json::parse(sent.at(index));
    }

    [[nodiscard]] auto lastSent() const -> nlohmann::ordered_json { return nlohmann::ordered_json::parse(sent.back()); }

    /// @brief Sends the challenge and accepts the resulting handshake request.
    void completeHandshake(nlohmann::ordered_json hello = nlohmann::ordered_json::object())
    {
        accept();
        receive(frame::makeEvent("connect.challenge", { { "nonce", "n1" } }));
        receive(frame::makeResponse("connect", true, std::move(hello)));
    }
};

class MockTransport final: public Transport
{
  public:
    explicit MockTransport(std::shared_ptr<MockConnection> connection): _connection(std::move(connection)) {}

    void open(std::string_view url, TransportHandler handler) override
    {
        _connection->url = std::string(url);
        _connection->handler = std::move(handler);
    }

    auto send(std::string_view text) -> VoidResult override
    {
        if (!_connection->open)
            return makeError(ErrorCode::TransportError, "Mock connection is not open");
        _connection->sent.emplace_back(text);
        return {};
    }

    auto ping() -> VoidResult override
    {
        if (!_connection->open)
            return makeError(ErrorCode::TransportError, "Mock connection is not open");
        ++_connection->pings;
        return {};
    }

    void close() override
    {
        _connection->closed = true;
        _connection->open = false;
        _connection->handler = {};
    }

    void terminate() override
    {
        _connection->terminated = true;
        _connection->open = false;
        _connection->handler = {};
    }

    auto isOpen() const -> bool override { return _connection->open; }

  private:
    std::shared_ptr<MockConnection> _connection;
};

/// @brief Creates mock transports and remembers every connection attempt.
class MockNetwork
{
  public:
    [[nodiscard]] auto factory() -> TransportFactory
    {
        return [this]() -> std::unique_ptr<Transport> {
            auto connection = std::make_shared<MockConnection>();
            _connections.push_back(connection);
            return std::make_unique<MockTransport>(std::move(connection));
        };
    }

    [[nodiscard]] auto attempts() const -> std::size_t { return _connections.size(); }
    [[nodiscard]] auto latest() -> MockConnection& { return *_connections.back(); }
    [[nodiscard]] auto at(std::size_t index) -> MockConnection& { return *_connections.at(index); }

  private:
    std::vector<std::shared_ptr<MockConnection>> _connections;
};

class RecordingConversation final: public ConversationSink
{
  public:
    std::vector<CanonicalEvent> events;

    void postEvent(const CanonicalEvent& event) override { events.push_back(event); }
};

class RecordingRendering final: public RenderingSink
{
  public:
    std::vector<std::vector<nlohmann::ordered_json>> batches;

    void postStructuredOperations(const std::vector<nlohmann::ordered_json>& operations) override
    {
        batches.push_back(operations);
    }
};

class RecordingEditor final: public EditorSink
{
  public:
    struct Diff
    {
        std::string original;
        std::string modified;
        std::string title;
    };

    std::vector<Diff> diffs;

    void showDiff(std::string_view original, std::string_view modified, std::string_view title) override
    {
        diffs.push_back(Diff { .original = std::string(original),
                               .modified = std::string(modified),
                               .title = std::string(title) });
    }
};

} // namespace gatelink::test
