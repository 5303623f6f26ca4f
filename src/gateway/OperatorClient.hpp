// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <events/CanonicalEvent.hpp>
#include <events/EventTranslator.hpp>
#include <gateway/ConnectionSession.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gatelink
{

/// @brief A conversation session known to the gateway.
struct Session
{
    std::string key;
    std::optional<std::string> agent;
    std::optional<std::string> label;
    std::optional<std::string> createdAt;
};

/// @brief Handle of a started conversational turn.
struct ChatRun
{
    std::string runId;
};

/// @brief Operator-role gateway client: conversations, sessions and pairing.
///
/// Push events of the session are normalized by an EventTranslator and forwarded to the
/// registered canonical event handlers.
class OperatorClient
{
  public:
    template <typename T>
    using Callback = std::function<void(Result<T>)>;
    using DoneCallback = std::function<void(VoidResult)>;
    using CanonicalHandler = std::function<void(const CanonicalEvent&)>;
    using HandlerId = ConnectionSession::HandlerId;

    OperatorClient(Scheduler& scheduler, TransportFactory transportFactory, ClientDescriptor client = {});
    ~OperatorClient();

    OperatorClient(const OperatorClient&) = delete;
    OperatorClient& operator=(const OperatorClient&) = delete;

    /// @brief The handshake declarations of an operator session.
    [[nodiscard]] static auto makeProfile(ClientDescriptor client) -> SessionProfile;

    void connect(ConnectOptions options, ConnectionSession::ConnectCallback callback = {});
    void disconnect();

    auto addEventHandler(CanonicalHandler handler) -> HandlerId;
    void removeEventHandler(HandlerId id);

    /// @brief Starts a conversational turn.
    /// @param sessionKey The conversation session.
    /// @param message The user message.
    /// @param callback Receives the run id of the started turn.
    void chatSend(std::string_view sessionKey, std::string_view message, Callback<ChatRun> callback);

    /// @brief Aborts a running turn.
    void chatAbort(std::string_view sessionKey, std::string_view runId, DoneCallback callback);

    /// @brief Fetches the message history of a session (empty if the gateway returns none).
    void chatHistory(std::string_view sessionKey, Callback<std::vector<nlohmann::ordered_json>> callback);

    void sessionList(Callback<std::vector<Session>> callback);
    void sessionCreate(std::string_view key, std::optional<std::string> agent, Callback<Session> callback);

    /// @brief Asks the gateway to pair this device as a canvas node.
    void nodePairRequest(Callback<nlohmann::ordered_json> callback);

    /// @brief Canvas host endpoint announced in the handshake response, if any.
    [[nodiscard]] auto canvasHostUrl() const -> std::optional<std::string>;

    /// @brief Session key of the last chatSend().
    [[nodiscard]] auto lastSessionKey() const -> const std::optional<std::string>& { return _lastSessionKey; }

    [[nodiscard]] auto session() noexcept -> ConnectionSession& { return _session; }
    [[nodiscard]] auto session() const noexcept -> const ConnectionSession& { return _session; }

  private:
    ConnectionSession _session;
    EventTranslator _translator;
    std::optional<Identity> _identity;
    std::optional<std::string> _lastSessionKey;

    HandlerId _nextHandlerId = 1;
    std::map<HandlerId, CanonicalHandler> _handlers;

    void handleEvent(const frame::Event& event);
};

/// @brief Parses a session object as returned by session.list and session.create.
[[nodiscard]] auto sessionFromJson(const nlohmann::ordered_json& value) -> Result<Session>;

} // namespace gatelink
