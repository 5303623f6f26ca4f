// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Scheduler.hpp>
#include <core/Types.hpp>
#include <gateway/Transport.hpp>
#include <identity/Identity.hpp>
#include <protocol/Frame.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gatelink
{

/// @brief Fixed protocol timings of a gateway session.
namespace timing
{
    constexpr auto HandshakeTimeout = std::chrono::milliseconds { 10'000 };
    constexpr auto HeartbeatInterval = std::chrono::milliseconds { 30'000 };
    constexpr auto HeartbeatTimeout = std::chrono::milliseconds { 10'000 };
    constexpr auto CommandTimeout = std::chrono::milliseconds { 30'000 };
    constexpr auto ReconnectBase = std::chrono::milliseconds { 1'000 };
    constexpr auto ReconnectMax = std::chrono::milliseconds { 30'000 };
    constexpr auto MaxReconnectAttempts = 10;
} // namespace timing

/// @brief Returns the delay before reconnect attempt @p attempt (0-based).
///
/// min(ReconnectBase * 2^attempt, ReconnectMax).
[[nodiscard]] auto reconnectDelay(int attempt) -> std::chrono::milliseconds;

/// @brief Returns the platform name reported in the client descriptor.
[[nodiscard]] auto defaultPlatform() -> std::string;

/// @brief Describes this client in the handshake request.
struct ClientDescriptor
{
    std::string id = "cli";
    std::string version = "0.1.0";
    std::string platform = defaultPlatform();
    std::string mode = "cli";
};

/// @brief What a session declares about itself during the handshake.
struct SessionProfile
{
    SessionRole role = SessionRole::Operator;
    std::vector<std::string> scopes;
    std::vector<std::string> caps;
    std::vector<std::string> commands;
    ClientDescriptor client;
    int minProtocol = 3;
    int maxProtocol = 3;
};

/// @brief Per-connect() parameters.
struct ConnectOptions
{
    std::string url;
    std::optional<std::string> token;
    std::optional<Identity> identity;
};

/// @brief One logical authenticated connection to the gateway.
///
/// Drives the challenge/connect handshake, heartbeats, bounded exponential reconnection
/// and request/response correlation. The same class serves every role; the role and
/// its declarations come from the SessionProfile.
///
/// Not thread-safe: all calls and all transport and timer callbacks must happen on the
/// scheduler thread.
class ConnectionSession
{
  public:
    using ConnectCallback = std::function<void(VoidResult)>;
    using CommandCallback = std::function<void(Result<nlohmann::ordered_json>)>;
    using EventHandler = std::function<void(const frame::Event&)>;
    using StateHandler = std::function<void(ConnectionState)>;
    using HandlerId = std::uint64_t;

    /// @brief Constructs a disconnected session.
    /// @param profile Role and declarations sent in the handshake.
    /// @param scheduler Timer service; must outlive the session.
    /// @param transportFactory Creates one transport per connection attempt.
    ConnectionSession(SessionProfile profile, Scheduler& scheduler, TransportFactory transportFactory);
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    /// @brief Opens a connection and performs the handshake.
    ///
    /// The callback fires exactly once: with success after the gateway accepted the
    /// handshake, or with the error of the first attempt. Later automatic reconnects
    /// are reported through state handlers only.
    void connect(ConnectOptions options, ConnectCallback callback = {});

    /// @brief Tears the session down for good.
    ///
    /// Cancels all timers, rejects all pending commands, closes the transport and
    /// suppresses reconnection. No callbacks fire after it returns.
    void disconnect();

    /// @brief Sends a command and reports the matching response.
    /// @param method The method name.
    /// @param params The parameters object.
    /// @param callback Receives the response payload or the failure.
    void sendCommand(std::string_view method, nlohmann::ordered_json params, CommandCallback callback);

    /// @brief Registers a handler for push events received after the handshake.
    auto addEventHandler(EventHandler handler) -> HandlerId;
    void removeEventHandler(HandlerId id);

    /// @brief Registers a handler for connectivity state changes.
    auto addStateHandler(StateHandler handler) -> HandlerId;
    void removeStateHandler(HandlerId id);

    [[nodiscard]] auto state() const -> ConnectionState { return _state; }
    [[nodiscard]] auto profile() const -> const SessionProfile& { return _profile; }

    /// @brief Payload of the last accepted handshake (auxiliary endpoint data).
    [[nodiscard]] auto helloPayload() const -> const nlohmann::ordered_json& { return _helloPayload; }

    /// @brief Number of commands awaiting a response.
    [[nodiscard]] auto pendingCount() const -> std::size_t { return _pending.size(); }

    /// @brief Number of reconnect attempts made since the last successful handshake.
    [[nodiscard]] auto reconnectAttempt() const -> int { return _reconnectAttempt; }

  private:
    struct PendingRequest
    {
        std::string method;
        CommandCallback callback;
        TimerId timer = 0;
    };

    SessionProfile _profile;
    log::Channel _log;
    Scheduler& _scheduler;
    TransportFactory _transportFactory;
    ConnectOptions _options;

    ConnectionState _state = ConnectionState::Disconnected;
    std::unique_ptr<Transport> _transport;
    std::unique_ptr<Transport> _retiredTransport;
    std::uint64_t _generation = 0;
    bool _handshakeDone = false;
    bool _intentionalDisconnect = true;
    int _reconnectAttempt = 0;
    ConnectCallback _connectCallback;
    nlohmann::ordered_json _helloPayload = nlohmann::ordered_json::object();

    TimerId _handshakeTimer = 0;
    TimerId _heartbeatTimer = 0;
    TimerId _heartbeatTimeoutTimer = 0;
    TimerId _reconnectTimer = 0;

    std::map<std::string, PendingRequest> _pending;

    HandlerId _nextHandlerId = 1;
    std::map<HandlerId, EventHandler> _eventHandlers;
    std::map<HandlerId, StateHandler> _stateHandlers;

    void openTransport();
    void retireTransport();
    void handleOpen();
    void handleMessage(std::string_view text);
    void handleHandshakeFrame(const frame::Frame& frame, const nlohmann::ordered_json& raw);
    void handleTransportError(const Error& error);
    void handleTransportClose();
    void handleConnectionLost(std::string_view reason);
    void sendHandshake(const std::optional<std::string>& nonce);
    void completeHandshake(const frame::Response& response);
    void failHandshake(Error error, bool retry);
    void finishConnect(VoidResult result);
    void scheduleReconnect();

    void startHeartbeat();
    void heartbeatTick();
    void handlePong();
    void handleHeartbeatTimeout();
    void stopHeartbeat();

    void resolvePending(const frame::Response& response, const nlohmann::ordered_json& raw);
    void handleCommandTimeout(const std::string& id);
    void rejectAllPending(ErrorCode code, std::string_view reason);

    void dispatchEvent(const frame::Event& event);
    void setState(ConnectionState state);
    void cancelTimer(TimerId& timer);
};

} // namespace gatelink
