// SPDX-License-Identifier: Apache-2.0
#include "ConnectionSession.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <utility>

namespace gatelink
{

namespace
{
    constexpr auto HandshakeRequestId = std::string_view { "connect" };
    constexpr auto ChallengeEvent = std::string_view { "connect.challenge" };

    // Command ids are unique across all sessions of the process.
    auto commandCounter = std::atomic<std::uint64_t> { 0 };

    auto nextCommandId() -> std::string
    {
        return std::format("cmd_{}", ++commandCounter);
    }

    auto currentTimeMs() -> std::int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    auto toJsonArray(const std::vector<std::string>& values) -> nlohmann::ordered_json
    {
        auto array = nlohmann::ordered_json::array();
        for (auto const& value: values)
            array.push_back(value);
        return array;
    }
} // namespace

auto reconnectDelay(int attempt) -> std::chrono::milliseconds
{
    auto delay = timing::ReconnectBase;
    for (auto i = 0; i < attempt && delay < timing::ReconnectMax; ++i)
        delay *= 2;
    return std::min(delay, timing::ReconnectMax);
}

auto defaultPlatform() -> std::string
{
#if defined(_WIN32)
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#else
    return "linux";
#endif
}

ConnectionSession::ConnectionSession(SessionProfile profile, Scheduler& scheduler, TransportFactory transportFactory):
    _profile(std::move(profile)),
    _log(roleToString(_profile.role)),
    _scheduler(scheduler), _transportFactory(std::move(transportFactory))
{
}

ConnectionSession::~ConnectionSession()
{
    _eventHandlers.clear();
    _stateHandlers.clear();
    disconnect();
}

void ConnectionSession::connect(ConnectOptions options, ConnectCallback callback)
{
    if (_state == ConnectionState::Connecting || _state == ConnectionState::Connected || _reconnectTimer != 0)
    {
        _log.debug("connect() while active, restarting session");
        disconnect();
    }

    _options = std::move(options);
    _intentionalDisconnect = false;
    _reconnectAttempt = 0;
    _connectCallback = std::move(callback);
    openTransport();
}

void ConnectionSession::disconnect()
{
    _intentionalDisconnect = true;
    cancelTimer(_reconnectTimer);
    cancelTimer(_handshakeTimer);
    stopHeartbeat();

    if (_transport)
    {
        _transport->close();
        retireTransport();
    }

    rejectAllPending(ErrorCode::Disconnected, "Client disconnected");
    finishConnect(makeError(ErrorCode::Disconnected, "Client disconnected"));
    setState(ConnectionState::Disconnected);
}

void ConnectionSession::sendCommand(std::string_view method, nlohmann::ordered_json params, CommandCallback callback)
{
    if (!_transport || !_transport->isOpen())
    {
        if (callback)
            callback(makeError(ErrorCode::TransportError, "Not connected"));
        return;
    }

    auto id = nextCommandId();
    auto const timer = _scheduler.schedule(timing::CommandTimeout, [this, id]() { handleCommandTimeout(id); });
    _pending.emplace(id,
                     PendingRequest {
                         .method = std::string(method),
                         .callback = std::move(callback),
                         .timer = timer,
                     });

    _log.trace("-> {} {}", id, method);
    auto sent = _transport->send(frame::makeRequest(id, method, std::move(params)).dump());
    if (!sent)
    {
        auto node = _pending.extract(id);
        _scheduler.cancel(node.mapped().timer);
        if (node.mapped().callback)
            node.mapped().callback(std::unexpected(sent.error()));
    }
}

auto ConnectionSession::addEventHandler(EventHandler handler) -> HandlerId
{
    auto const id = _nextHandlerId++;
    _eventHandlers.emplace(id, std::move(handler));
    return id;
}

void ConnectionSession::removeEventHandler(HandlerId id)
{
    _eventHandlers.erase(id);
}

auto ConnectionSession::addStateHandler(StateHandler handler) -> HandlerId
{
    auto const id = _nextHandlerId++;
    _stateHandlers.emplace(id, std::move(handler));
    return id;
}

void ConnectionSession::removeStateHandler(HandlerId id)
{
    _stateHandlers.erase(id);
}

void ConnectionSession::openTransport()
{
    cancelTimer(_reconnectTimer);
    _retiredTransport.reset();

    setState(ConnectionState::Connecting);
    _log.info("Connecting to {}", _options.url);

    auto const generation = ++_generation;
    _handshakeDone = false;
    _transport = _transportFactory();
    if (!_transport)
    {
        handleTransportError(Error { ErrorCode::TransportError, "No transport available" });
        return;
    }

    auto const current = [this, generation]() { return generation == _generation; };

    _transport->open(_options.url,
                     TransportHandler {
                         .onOpen =
                             [this, current]() {
                                 if (current())
                                     handleOpen();
                             },
                         .onMessage =
                             [this, current](std::string_view text) {
                                 if (current())
                                     handleMessage(text);
                             },
                         .onPong =
                             [this, current]() {
                                 if (current())
                                     handlePong();
                             },
                         .onError =
                             [this, current](Error error) {
                                 if (current())
                                     handleTransportError(error);
                             },
                         .onClose =
                             [this, current]() {
                                 if (current())
                                     handleTransportClose();
                             },
                     });
}

void ConnectionSession::retireTransport()
{
    // Kept alive until the next attempt: the transport may still be executing the
    // callback that led here.
    ++_generation;
    _retiredTransport = std::move(_transport);
}

void ConnectionSession::handleOpen()
{
    _log.debug("Transport open, waiting for challenge");
    cancelTimer(_handshakeTimer);
    _handshakeTimer = _scheduler.schedule(timing::HandshakeTimeout, [this]() {
        _handshakeTimer = 0;
        _log.warning("Handshake timed out");
        failHandshake(Error { ErrorCode::HandshakeError, "Handshake timed out waiting for connect response" },
                      true);
    });
}

void ConnectionSession::handleMessage(std::string_view text)
{
    auto raw = json::parse(text);
    if (!raw)
    {
        _log.debug("Dropping malformed frame: {}", raw.error().message);
        return;
    }

    auto parsed = frame::parse(*raw);
    if (!parsed)
    {
        _log.debug("Dropping unrecognized frame: {}", parsed.error().message);
        return;
    }

    if (!_handshakeDone)
    {
        handleHandshakeFrame(*parsed, *raw);
        return;
    }

    if (auto const* event = std::get_if<frame::Event>(&*parsed))
        dispatchEvent(*event);
    else if (auto const* response = std::get_if<frame::Response>(&*parsed))
        resolvePending(*response, *raw);
    else
        _log.trace("Ignoring inbound request frame");
}

void ConnectionSession::handleHandshakeFrame(const frame::Frame& frame, const nlohmann::ordered_json& raw)
{
    if (auto const* event = std::get_if<frame::Event>(&frame))
    {
        if (event->name == ChallengeEvent)
        {
            auto const nonce = json::getOptionalString(event->payload, "nonce");
            _log.debug("Received challenge (nonce: {})", nonce.value_or("<none>"));
            sendHandshake(nonce);
        }
        else
        {
            _log.trace("Ignoring event '{}' before handshake", event->name);
        }
        return;
    }

    if (auto const* response = std::get_if<frame::Response>(&frame))
    {
        if (response->id != HandshakeRequestId)
        {
            resolvePending(*response, raw);
            return;
        }

        if (response->ok)
            completeHandshake(*response);
        else
            failHandshake(Error { ErrorCode::HandshakeError, frame::formatError(response->error) }, false);
    }
}

void ConnectionSession::sendHandshake(const std::optional<std::string>& nonce)
{
    auto const role = std::string(roleToString(_profile.role));

    auto params = nlohmann::ordered_json {
        { "minProtocol", _profile.minProtocol },
        { "maxProtocol", _profile.maxProtocol },
        { "client",
          {
              { "id", _profile.client.id },
              { "version", _profile.client.version },
              { "platform", _profile.client.platform },
              { "mode", _profile.client.mode },
          } },
        { "role", role },
        { "scopes", toJsonArray(_profile.scopes) },
        { "caps", toJsonArray(_profile.caps) },
        { "commands", toJsonArray(_profile.commands) },
        { "permissions", nlohmann::ordered_json::object() },
    };

    if (_options.token)
        params["auth"] = { { "token", *_options.token } };

    if (_options.identity)
    {
        auto assertion = createDeviceAssertion(*_options.identity,
                                               AssertionParams {
                                                   .clientId = _profile.client.id,
                                                   .clientMode = _profile.client.mode,
                                                   .role = role,
                                                   .scopes = _profile.scopes,
                                                   .signedAtMs = currentTimeMs(),
                                                   .token = _options.token,
                                                   .nonce = nonce,
                                               });
        if (!assertion)
        {
            _log.error("Cannot sign device assertion: {}", assertion.error().message);
            failHandshake(assertion.error(), false);
            return;
        }
        params["device"] = assertion->toJson();
    }

    auto sent = _transport->send(frame::makeRequest(HandshakeRequestId, "connect", std::move(params)).dump());
    if (!sent)
        handleTransportError(sent.error());
}

void ConnectionSession::completeHandshake(const frame::Response& response)
{
    cancelTimer(_handshakeTimer);
    _handshakeDone = true;
    _helloPayload = response.payload.value_or(nlohmann::ordered_json::object());
    _reconnectAttempt = 0;

    _log.info("Connected (protocol {})",
              _helloPayload.is_object() ? _helloPayload.value("protocol", nlohmann::ordered_json()).dump() : "?");

    setState(ConnectionState::Connected);
    startHeartbeat();
    finishConnect({});
}

void ConnectionSession::failHandshake(Error error, bool retry)
{
    cancelTimer(_handshakeTimer);
    _log.error("Handshake failed: {}", error.message);

    if (_transport)
    {
        _transport->close();
        retireTransport();
    }

    rejectAllPending(ErrorCode::Disconnected, "Connection closed during handshake");
    setState(ConnectionState::Error);
    finishConnect(std::unexpected(std::move(error)));

    if (retry)
        scheduleReconnect();
}

void ConnectionSession::finishConnect(VoidResult result)
{
    if (auto callback = std::exchange(_connectCallback, nullptr))
        callback(std::move(result));
}

void ConnectionSession::handleTransportError(const Error& error)
{
    if (_handshakeDone)
    {
        _log.warning("Transport error: {}", error.message);
        handleConnectionLost(error.message);
        return;
    }

    _log.warning("Connection attempt failed: {}", error.message);
    cancelTimer(_handshakeTimer);
    retireTransport();
    rejectAllPending(ErrorCode::Disconnected, error.message);
    setState(ConnectionState::Error);
    finishConnect(makeError(ErrorCode::TransportError, error.message));
    scheduleReconnect();
}

void ConnectionSession::handleTransportClose()
{
    if (_handshakeDone)
    {
        handleConnectionLost("Connection closed");
        return;
    }

    _log.warning("Connection closed during handshake");
    cancelTimer(_handshakeTimer);
    retireTransport();
    rejectAllPending(ErrorCode::Disconnected, "Connection closed during handshake");
    setState(ConnectionState::Error);
    finishConnect(makeError(ErrorCode::TransportError, "Connection closed during handshake"));
    scheduleReconnect();
}

void ConnectionSession::handleConnectionLost(std::string_view reason)
{
    _log.warning("Connection lost: {}", reason);
    stopHeartbeat();
    _handshakeDone = false;
    retireTransport();
    rejectAllPending(ErrorCode::Disconnected, reason);
    setState(ConnectionState::Disconnected);
    scheduleReconnect();
}

void ConnectionSession::scheduleReconnect()
{
    if (_intentionalDisconnect)
        return;

    if (_reconnectAttempt >= timing::MaxReconnectAttempts)
    {
        _log.error("Giving up after {} reconnect attempts", _reconnectAttempt);
        setState(ConnectionState::Error);
        return;
    }

    auto const delay = reconnectDelay(_reconnectAttempt);
    ++_reconnectAttempt;
    _log.info("Reconnecting in {} ms (attempt {}/{})",
              delay.count(),
              _reconnectAttempt,
              timing::MaxReconnectAttempts);

    cancelTimer(_reconnectTimer);
    _reconnectTimer = _scheduler.schedule(delay, [this]() {
        _reconnectTimer = 0;
        if (!_intentionalDisconnect)
            openTransport();
    });
}

void ConnectionSession::startHeartbeat()
{
    stopHeartbeat();
    _heartbeatTimer = _scheduler.schedule(timing::HeartbeatInterval, [this]() { heartbeatTick(); });
}

void ConnectionSession::heartbeatTick()
{
    _heartbeatTimer = 0;
    if (!_transport || !_transport->isOpen())
        return;

    if (auto sent = _transport->ping(); !sent)
        _log.warning("Heartbeat ping failed: {}", sent.error().message);

    if (_heartbeatTimeoutTimer == 0)
    {
        _heartbeatTimeoutTimer =
            _scheduler.schedule(timing::HeartbeatTimeout, [this]() { handleHeartbeatTimeout(); });
    }

    _heartbeatTimer = _scheduler.schedule(timing::HeartbeatInterval, [this]() { heartbeatTick(); });
}

void ConnectionSession::handlePong()
{
    _log.trace("Heartbeat acknowledged");
    cancelTimer(_heartbeatTimeoutTimer);
}

void ConnectionSession::handleHeartbeatTimeout()
{
    _heartbeatTimeoutTimer = 0;
    _log.warning("No heartbeat acknowledgment, dropping connection");
    if (_transport)
        _transport->terminate();
    handleConnectionLost("Heartbeat timed out");
}

void ConnectionSession::stopHeartbeat()
{
    cancelTimer(_heartbeatTimer);
    cancelTimer(_heartbeatTimeoutTimer);
}

void ConnectionSession::resolvePending(const frame::Response& response, const nlohmann::ordered_json& raw)
{
    auto node = _pending.extract(response.id);
    if (node.empty())
    {
        _log.debug("Response for unknown request '{}'", response.id);
        return;
    }

    auto& pending = node.mapped();
    _scheduler.cancel(pending.timer);
    _log.trace("<- {} {} ok={}", response.id, pending.method, response.ok);

    if (!pending.callback)
        return;

    if (response.ok)
        pending.callback(response.payload.value_or(raw));
    else
        pending.callback(makeError(ErrorCode::CommandRejected, frame::formatError(response.error)));
}

void ConnectionSession::handleCommandTimeout(const std::string& id)
{
    auto node = _pending.extract(id);
    if (node.empty())
        return;

    auto& pending = node.mapped();
    _log.warning("Command '{}' ({}) timed out", pending.method, id);
    if (pending.callback)
        pending.callback(makeError(ErrorCode::CommandTimeout, std::format("Command '{}' timed out", pending.method)));
}

void ConnectionSession::rejectAllPending(ErrorCode code, std::string_view reason)
{
    auto pending = std::exchange(_pending, {});
    for (auto& [id, request]: pending)
    {
        _scheduler.cancel(request.timer);
        if (request.callback)
            request.callback(makeError(code, std::string(reason)));
    }
}

void ConnectionSession::dispatchEvent(const frame::Event& event)
{
    auto handlers = std::vector<EventHandler> {};
    handlers.reserve(_eventHandlers.size());
    for (auto const& [id, handler]: _eventHandlers)
        handlers.push_back(handler);

    for (auto const& handler: handlers)
        handler(event);
}

void ConnectionSession::setState(ConnectionState state)
{
    if (_state == state)
        return;

    _log.debug("State: {} -> {}",
               connectionStateToString(_state),
               connectionStateToString(state));
    _state = state;

    auto handlers = std::vector<StateHandler> {};
    handlers.reserve(_stateHandlers.size());
    for (auto const& [id, handler]: _stateHandlers)
        handlers.push_back(handler);

    for (auto const& handler: handlers)
        handler(state);
}

void ConnectionSession::cancelTimer(TimerId& timer)
{
    if (timer == 0)
        return;
    _scheduler.cancel(timer);
    timer = 0;
}

} // namespace gatelink
