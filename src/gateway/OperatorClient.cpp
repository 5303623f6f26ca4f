// SPDX-License-Identifier: Apache-2.0
#include "OperatorClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace gatelink
{

namespace
{
    /// Version reported when pairing as a node.
    constexpr auto NodeVersion = std::string_view { "0.1.0" };
} // namespace

OperatorClient::OperatorClient(Scheduler& scheduler, TransportFactory transportFactory, ClientDescriptor client):
    _session(makeProfile(std::move(client)), scheduler, std::move(transportFactory))
{
    _session.addEventHandler([this](const frame::Event& event) { handleEvent(event); });
}

OperatorClient::~OperatorClient()
{
    _handlers.clear();
    _session.disconnect();
}

auto OperatorClient::makeProfile(ClientDescriptor client) -> SessionProfile
{
    return SessionProfile {
        .role = SessionRole::Operator,
        .scopes = { "operator.admin", "operator.approvals", "operator.pairing" },
        .caps = {},
        .commands = {},
        .client = std::move(client),
    };
}

void OperatorClient::connect(ConnectOptions options, ConnectionSession::ConnectCallback callback)
{
    _identity = options.identity;
    _session.connect(std::move(options), std::move(callback));
}

void OperatorClient::disconnect()
{
    _session.disconnect();
}

auto OperatorClient::addEventHandler(CanonicalHandler handler) -> HandlerId
{
    auto const id = _nextHandlerId++;
    _handlers.emplace(id, std::move(handler));
    return id;
}

void OperatorClient::removeEventHandler(HandlerId id)
{
    _handlers.erase(id);
}

void OperatorClient::handleEvent(const frame::Event& event)
{
    auto canonical = _translator.translate(event);
    if (!canonical)
        return;

    auto handlers = std::vector<CanonicalHandler> {};
    for (auto const& [id, handler]: _handlers)
        handlers.push_back(handler);
    for (auto const& handler: handlers)
        handler(*canonical);
}

void OperatorClient::chatSend(std::string_view sessionKey, std::string_view message, Callback<ChatRun> callback)
{
    auto idempotencyKey = randomUuid();
    if (!idempotencyKey)
    {
        if (callback)
            callback(std::unexpected(idempotencyKey.error()));
        return;
    }

    _lastSessionKey = std::string(sessionKey);
    auto params = nlohmann::ordered_json {
        { "sessionKey", sessionKey },
        { "message", message },
        { "idempotencyKey", *idempotencyKey },
    };
    auto onResult = [callback = std::move(callback)](Result<nlohmann::ordered_json> result) {
        if (!callback)
            return;
        callback(result.transform([](const nlohmann::ordered_json& payload) {
            return ChatRun { .runId = json::getStringOr(payload, "runId", "") };
        }));
    };
    _session.sendCommand("chat.send", std::move(params), std::move(onResult));
}

void OperatorClient::chatAbort(std::string_view sessionKey, std::string_view runId, DoneCallback callback)
{
    auto params = nlohmann::ordered_json { { "sessionKey", sessionKey }, { "runId", runId } };
    auto onResult = [callback = std::move(callback)](Result<nlohmann::ordered_json> result) {
        if (callback)
            callback(result.transform([](const nlohmann::ordered_json&) {}));
    };
    _session.sendCommand("chat.abort", std::move(params), std::move(onResult));
}

void OperatorClient::chatHistory(std::string_view sessionKey, Callback<std::vector<nlohmann::ordered_json>> callback)
{
    auto params = nlohmann::ordered_json { { "sessionKey", sessionKey } };
    auto onResult = [callback = std::move(callback)](Result<nlohmann::ordered_json> result) {
        if (!callback)
            return;
        callback(result.transform([](const nlohmann::ordered_json& payload) {
            auto messages = std::vector<nlohmann::ordered_json> {};
            if (auto const* list = json::find(payload, "messages"); list && list->is_array())
                messages.assign(list->begin(), list->end());
            return messages;
        }));
    };
    _session.sendCommand("chat.history", std::move(params), std::move(onResult));
}

void OperatorClient::sessionList(Callback<std::vector<Session>> callback)
{
    auto onResult = [callback = std::move(callback)](Result<nlohmann::ordered_json> result) {
        if (!callback)
            return;
        callback(result.transform([](const nlohmann::ordered_json& payload) {
            auto sessions = std::vector<Session> {};
            auto const* list = json::find(payload, "sessions");
            if (!list || !list->is_array())
                return sessions;
            for (auto const& entry: *list)
            {
                if (auto session = sessionFromJson(entry))
                    sessions.push_back(std::move(*session));
                else
                    log::debug("Skipping malformed session entry: {}", session.error().message);
            }
            return sessions;
        }));
    };
    _session.sendCommand("session.list", nlohmann::ordered_json::object(), std::move(onResult));
}

void OperatorClient::sessionCreate(std::string_view key, std::optional<std::string> agent, Callback<Session> callback)
{
    auto params = nlohmann::ordered_json { { "key", key } };
    if (agent && !agent->empty())
        params["agent"] = *agent;

    auto onResult = [callback = std::move(callback)](Result<nlohmann::ordered_json> result) {
        if (!callback)
            return;
        callback(result.and_then([](const nlohmann::ordered_json& payload) { return sessionFromJson(payload); }));
    };
    _session.sendCommand("session.create", std::move(params), std::move(onResult));
}

void OperatorClient::nodePairRequest(Callback<nlohmann::ordered_json> callback)
{
    auto nodeId = std::string {};
    if (_identity)
        nodeId = _identity->fingerprint();
    else if (auto uuid = randomUuid())
        nodeId = std::move(*uuid);
    else
    {
        if (callback)
            callback(std::unexpected(uuid.error()));
        return;
    }

    auto const& client = _session.profile().client;
    auto params = nlohmann::ordered_json {
        { "nodeId", nodeId },
        { "displayName", std::format("gatelink ({})", client.platform) },
        { "platform", client.platform },
        { "version", NodeVersion },
        { "caps", nlohmann::ordered_json::array({ "canvas" }) },
        { "commands", nlohmann::ordered_json::array({ "canvas.present" }) },
    };
    _session.sendCommand("node.pair.request", std::move(params), std::move(callback));
}

auto OperatorClient::canvasHostUrl() const -> std::optional<std::string>
{
    return json::getOptionalString(_session.helloPayload(), "canvasHostUrl");
}

auto sessionFromJson(const nlohmann::ordered_json& value) -> Result<Session>
{
    auto key = json::getString(value, "key");
    if (!key)
        return std::unexpected(key.error());

    return Session {
        .key = std::move(*key),
        .agent = json::getOptionalString(value, "agent"),
        .label = json::getOptionalString(value, "label"),
        .createdAt = json::getOptionalString(value, "createdAt"),
    };
}

} // namespace gatelink
