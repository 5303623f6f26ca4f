// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <events/Sinks.hpp>
#include <gateway/ConnectionSession.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace gatelink
{

/// @brief A `node.invoke.request` pushed by the gateway.
struct InvokeRequest
{
    std::string id;
    std::string nodeId;
    std::string command;
    nlohmann::ordered_json params;
};

/// @brief Parses the payload of a `node.invoke.request` event.
///
/// `paramsJSON` is a JSON encoded string; if it is absent or does not parse, params is null.
[[nodiscard]] auto invokeRequestFromJson(const nlohmann::ordered_json& payload) -> Result<InvokeRequest>;

/// @brief Node-role gateway client exposing the canvas capability.
///
/// Canvas structured-UI commands are converted and applied to the rendering sink. Every
/// other command is forwarded to the application's invoke handler.
class NodeClient
{
  public:
    /// @brief Executes a non-canvas command; the value becomes the result payload.
    using InvokeHandler =
        std::function<Result<nlohmann::ordered_json>(std::string_view command, const nlohmann::ordered_json& params)>;

    NodeClient(Scheduler& scheduler,
               TransportFactory transportFactory,
               RenderingSink& rendering,
               ClientDescriptor client = {});
    ~NodeClient();

    NodeClient(const NodeClient&) = delete;
    NodeClient& operator=(const NodeClient&) = delete;

    /// @brief The handshake declarations of a canvas node session.
    [[nodiscard]] static auto makeProfile(ClientDescriptor client) -> SessionProfile;

    void connect(ConnectOptions options, ConnectionSession::ConnectCallback callback = {});
    void disconnect();

    void setInvokeHandler(InvokeHandler handler) { _invokeHandler = std::move(handler); }

    [[nodiscard]] auto session() noexcept -> ConnectionSession& { return _session; }
    [[nodiscard]] auto session() const noexcept -> const ConnectionSession& { return _session; }

  private:
    ConnectionSession _session;
    RenderingSink& _rendering;
    InvokeHandler _invokeHandler;

    void handleEvent(const frame::Event& event);
    auto execute(const InvokeRequest& request) -> Result<std::optional<nlohmann::ordered_json>>;
    void sendResult(const InvokeRequest& request, const Result<std::optional<nlohmann::ordered_json>>& result);
};

} // namespace gatelink
