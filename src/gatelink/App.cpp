// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <events/EventRouter.hpp>
#include <gatelink/ConsoleOutput.hpp>
#include <gatelink/LineReader.hpp>
#include <gateway/NodeClient.hpp>
#include <gateway/OperatorClient.hpp>
#include <identity/Identity.hpp>
#include <net/AsioScheduler.hpp>
#include <net/WebSocketTransport.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>

#include <format>
#include <optional>
#include <print>
#include <string>

#include <unistd.h>

namespace gatelink
{

namespace
{
    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    /// Flattens a history message's content, which is either a string or a list of parts.
    auto messageText(const nlohmann::ordered_json& message) -> std::string
    {
        auto const* content = json::find(message, "content");
        if (!content)
            return json::getStringOr(message, "text", "");
        if (content->is_string())
            return content->get<std::string>();

        auto text = std::string {};
        if (content->is_array())
        {
            for (auto const& part: *content)
            {
                if (auto piece = json::getOptionalString(part, "text"))
                    text += *piece;
            }
        }
        return text;
    }

    void printHelp(ConsoleOutput& console)
    {
        console.notice("Commands:\n"
                       "  /abort        abort the running turn\n"
                       "  /history      show the conversation history\n"
                       "  /sessions     list gateway sessions\n"
                       "  /new <key>    create a session and switch to it\n"
                       "  /pair         request pairing of this device as a canvas node\n"
                       "  /quit         disconnect and exit");
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    boost::asio::io_context io;
    boost::asio::ssl::context tls = WebSocketTransport::makeTlsContext();
    AsioScheduler scheduler { io };
    ConsoleOutput console;
    EventRouter router { console, console, console };

    std::optional<Identity> identity;
    std::unique_ptr<OperatorClient> operatorClient;
    std::unique_ptr<NodeClient> nodeClient;

    std::string sessionKey;
    std::optional<std::string> activeRun;
    bool stopping = false;

    explicit Impl(AppConfig cfg): config(std::move(cfg)), sessionKey(config.session.key) {}

    auto connectOptions() const -> ConnectOptions
    {
        return ConnectOptions { .url = config.gateway.url, .token = config.gateway.token, .identity = identity };
    }

    void handleCanonicalEvent(const CanonicalEvent& event)
    {
        if (event.kind() == EventKind::Completion)
            activeRun.reset();
        router.route(event);
    }

    void connectSessions()
    {
        console.notice(std::format("Connecting to {} ...", config.gateway.url));
        operatorClient->connect(connectOptions(), [this](VoidResult result) {
            if (!result)
            {
                log::error("Operator session failed: {}", result.error());
                return;
            }
            console.notice(std::format("Connected. Session '{}'. Type /help for commands.", sessionKey));
            if (auto const canvasHost = operatorClient->canvasHostUrl())
                log::info("Canvas host: {}", *canvasHost);
        });

        if (!nodeClient)
            return;
        nodeClient->connect(connectOptions(), [](VoidResult result) {
            if (!result)
                log::error("Canvas node session failed: {}", result.error());
            else
                log::info("Canvas node session connected");
        });
    }

    void sendMessage(std::string_view text)
    {
        router.resetSequence();
        operatorClient->chatSend(sessionKey, text, [this](Result<ChatRun> run) {
            if (!run)
            {
                console.notice(std::format("Send failed: {}", run.error().message));
                return;
            }
            activeRun = run->runId;
            log::debug("Started run {}", run->runId);
        });
    }

    void abortRun()
    {
        if (!activeRun)
        {
            console.notice("No active run");
            return;
        }
        operatorClient->chatAbort(sessionKey, *activeRun, [this](VoidResult result) {
            if (!result)
                console.notice(std::format("Abort failed: {}", result.error().message));
            else
                console.notice("Aborted");
        });
    }

    void showHistory()
    {
        operatorClient->chatHistory(sessionKey, [this](Result<std::vector<nlohmann::ordered_json>> messages) {
            if (!messages)
            {
                console.notice(std::format("History failed: {}", messages.error().message));
                return;
            }
            if (messages->empty())
            {
                console.notice("(no messages)");
                return;
            }
            for (auto const& message: *messages)
                console.notice(
                    std::format("{}: {}", json::getStringOr(message, "role", "?"), messageText(message)));
        });
    }

    void listSessions()
    {
        operatorClient->sessionList([this](Result<std::vector<Session>> sessions) {
            if (!sessions)
            {
                console.notice(std::format("Listing sessions failed: {}", sessions.error().message));
                return;
            }
            for (auto const& session: *sessions)
            {
                auto const marker = session.key == sessionKey ? "*" : " ";
                console.notice(std::format("{} {}{}{}",
                                           marker,
                                           session.key,
                                           session.agent ? std::format(" ({})", *session.agent) : "",
                                           session.label ? std::format(" - {}", *session.label) : ""));
            }
        });
    }

    void createSession(std::string_view key)
    {
        if (key.empty())
        {
            console.notice("Usage: /new <key>");
            return;
        }
        operatorClient->sessionCreate(key, config.session.agent, [this](Result<Session> session) {
            if (!session)
            {
                console.notice(std::format("Creating session failed: {}", session.error().message));
                return;
            }
            sessionKey = session->key;
            activeRun.reset();
            router.resetSequence();
            console.notice(std::format("Switched to session '{}'", sessionKey));
        });
    }

    void requestPairing()
    {
        operatorClient->nodePairRequest([this](Result<nlohmann::ordered_json> payload) {
            if (!payload)
                console.notice(std::format("Pairing request failed: {}", payload.error().message));
            else
                console.notice(std::format("Pairing requested: {}", payload->dump()));
        });
    }

    void handleLine(std::string_view input)
    {
        auto const line = trim(input);
        if (line.empty() || stopping)
            return;

        if (line == "/quit" || line == "/exit")
        {
            shutdown();
            return;
        }
        if (line == "/help")
        {
            printHelp(console);
            return;
        }
        if (line == "/abort")
        {
            abortRun();
            return;
        }
        if (line == "/history")
        {
            showHistory();
            return;
        }
        if (line == "/sessions")
        {
            listSessions();
            return;
        }
        if (line == "/new" || line.starts_with("/new "))
        {
            createSession(trim(line.substr(4)));
            return;
        }
        if (line == "/pair")
        {
            requestPairing();
            return;
        }
        if (line.starts_with("/"))
        {
            console.notice(std::format("Unknown command: {}", line));
            return;
        }

        sendMessage(line);
    }

    void shutdown()
    {
        if (stopping)
            return;
        stopping = true;
        if (nodeClient)
            nodeClient->disconnect();
        operatorClient->disconnect();
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto& impl = *_impl;

    if (impl.config.device.isConfigured())
    {
        auto identity = Identity::fromHex(impl.config.device.publicKey, impl.config.device.privateKey);
        if (!identity)
            return std::unexpected(identity.error());
        log::info("Device identity {}", identity->fingerprint());
        impl.identity = std::move(*identity);
    }
    else
        log::info("No device identity configured, connecting with token only");

    auto const factory = WebSocketTransport::factory(impl.io, impl.tls);

    impl.operatorClient = std::make_unique<OperatorClient>(impl.scheduler, factory);
    impl.operatorClient->addEventHandler([&impl](const CanonicalEvent& event) { impl.handleCanonicalEvent(event); });
    impl.operatorClient->session().addStateHandler([&impl](ConnectionState state) {
        log::debug("Operator session is {}", connectionStateToString(state));
        if (state == ConnectionState::Error && !impl.stopping)
            impl.console.notice("Gateway connection failed");
    });

    if (impl.config.node.enabled)
        impl.nodeClient = std::make_unique<NodeClient>(impl.scheduler, factory, impl.console);

    return {};
}

auto App::run() -> int
{
    auto& impl = *_impl;
    auto work = boost::asio::make_work_guard(impl.io);

    boost::asio::post(impl.io, [&impl]() { impl.connectSessions(); });

    auto reader = LineReader(
        STDIN_FILENO,
        [&impl](std::string line) {
            boost::asio::post(impl.io, [&impl, line = std::move(line)]() { impl.handleLine(line); });
        },
        [&impl]() { boost::asio::post(impl.io, [&impl]() { impl.shutdown(); }); });
    reader.start();

    while (!impl.stopping)
        impl.io.run_one();

    reader.stop();

    // Let close handshakes and cancelled timers drain.
    work.reset();
    impl.io.run();

    return 0;
}

} // namespace gatelink
