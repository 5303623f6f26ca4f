// SPDX-License-Identifier: Apache-2.0
#include "NodeClient.hpp"

#include <canvas/UiGraphConverter.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <vector>

namespace gatelink
{

namespace
{
    constexpr auto nodeLog = log::Channel { "node" };
    constexpr auto InvokeRequestEvent = std::string_view { "node.invoke.request" };

    void applyOperations(RenderingSink& rendering,
                         std::string_view command,
                         std::vector<nlohmann::ordered_json> operations)
    {
        nodeLog.debug("{} produced {} operation(s)", command, operations.size());
        if (!operations.empty())
            rendering.postStructuredOperations(operations);
    }
} // namespace

auto invokeRequestFromJson(const nlohmann::ordered_json& payload) -> Result<InvokeRequest>
{
    auto id = json::getString(payload, "id");
    if (!id)
        return std::unexpected(id.error());
    auto command = json::getString(payload, "command");
    if (!command)
        return std::unexpected(command.error());

    auto request = InvokeRequest {
        .id = std::move(*id),
        .nodeId = json::getStringOr(payload, "nodeId", ""),
        .command = std::move(*command),
        .params = nullptr,
    };

    if (auto const text = json::getOptionalString(payload, "paramsJSON"); text && !text->empty())
    {
        if (auto params = json::parse(*text))
            request.params = std::move(*params);
        else
            nodeLog.warning("Failed to parse paramsJSON for {}: {}", request.command, params.error().message);
    }
    return request;
}

NodeClient::NodeClient(Scheduler& scheduler,
                       TransportFactory transportFactory,
                       RenderingSink& rendering,
                       ClientDescriptor client):
    _session(makeProfile(std::move(client)), scheduler, std::move(transportFactory)), _rendering(rendering)
{
    _session.addEventHandler([this](const frame::Event& event) { handleEvent(event); });
}

NodeClient::~NodeClient()
{
    _session.disconnect();
}

auto NodeClient::makeProfile(ClientDescriptor client) -> SessionProfile
{
    return SessionProfile {
        .role = SessionRole::Node,
        .scopes = {},
        .caps = { "canvas" },
        .commands = { "canvas.present",
                      "canvas.hide",
                      "canvas.navigate",
                      "canvas.eval",
                      "canvas.snapshot",
                      "canvas.a2ui.push",
                      "canvas.a2ui.pushJSONL",
                      "canvas.a2ui.reset" },
        .client = std::move(client),
    };
}

void NodeClient::connect(ConnectOptions options, ConnectionSession::ConnectCallback callback)
{
    _session.connect(std::move(options), std::move(callback));
}

void NodeClient::disconnect()
{
    _session.disconnect();
}

void NodeClient::handleEvent(const frame::Event& event)
{
    // Conversation broadcasts are meant for the operator session.
    if (event.name != InvokeRequestEvent)
        return;

    auto request = invokeRequestFromJson(event.payload);
    if (!request)
    {
        nodeLog.warning("Malformed invoke request: {}", request.error().message);
        return;
    }

    nodeLog.info("invoke {} (id {})", request->command, request->id);
    sendResult(*request, execute(*request));
}

auto NodeClient::execute(const InvokeRequest& request) -> Result<std::optional<nlohmann::ordered_json>>
{
    if (request.command == "canvas.a2ui.push")
    {
        auto const* messages = json::find(request.params, "messages");
        if (!messages || !messages->is_array())
            return makeError(ErrorCode::InvalidArgument, "canvas.a2ui.push requires a messages array");
        applyOperations(_rendering,
                        request.command,
                        canvas::convertEach(std::vector<nlohmann::ordered_json>(messages->begin(), messages->end())));
        return std::nullopt;
    }

    if (request.command == "canvas.a2ui.pushJSONL")
    {
        auto jsonl = json::getString(request.params, "jsonl");
        if (!jsonl)
            return makeError(ErrorCode::InvalidArgument, "canvas.a2ui.pushJSONL requires a jsonl string");
        applyOperations(_rendering, request.command, canvas::convertJsonl(*jsonl));
        return std::nullopt;
    }

    if (request.command == "canvas.a2ui.reset")
    {
        applyOperations(_rendering,
                        request.command,
                        { nlohmann::ordered_json {
                            { "deleteSurface", { { "surfaceId", canvas::DefaultSurfaceId } } },
                        } });
        return std::nullopt;
    }

    if (!_invokeHandler)
        return makeError(ErrorCode::InvalidArgument, std::format("no handler for {}", request.command));

    return _invokeHandler(request.command, request.params).transform([](nlohmann::ordered_json payload) {
        return std::optional<nlohmann::ordered_json>(std::move(payload));
    });
}

void NodeClient::sendResult(const InvokeRequest& request, const Result<std::optional<nlohmann::ordered_json>>& result)
{
    auto params = nlohmann::ordered_json {
        { "id", request.id },
        { "nodeId", request.nodeId },
        { "ok", result.has_value() },
        { "payloadJSON", nullptr },
        { "error", nullptr },
    };
    if (result && *result)
        params["payloadJSON"] = (*result)->dump();
    if (!result)
        params["error"] = { { "message", result.error().message } };

    nodeLog.debug("invoke result id={} ok={}", request.id, result.has_value());

    auto onReply = [id = request.id](Result<nlohmann::ordered_json> reply) {
        if (!reply)
            nodeLog.warning("invoke result {} not delivered: {}", id, reply.error().message);
    };
    _session.sendCommand("node.invoke.result", std::move(params), std::move(onReply));
}

} // namespace gatelink
