// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <gatelink/App.hpp>
#include <gatelink/Config.hpp>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "gatelink - gateway client for conversations and canvas surfaces" };

    auto configPath = std::string {};
    auto url = std::string {};
    auto token = std::string {};
    auto sessionKey = std::string {};
    auto node = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-u,--url", url, "Gateway WebSocket URL (ws:// or wss://)");
    app.add_option("-t,--token", token, "Gateway auth token");
    app.add_option("-s,--session", sessionKey, "Conversation session key");
    app.add_flag("--node", node, "Also connect as a canvas node");
    auto* verbose = app.add_flag("-v,--verbose", "Increase log verbosity (-v debug, -vv trace)");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? gatelink::loadConfig() : gatelink::loadConfigFromFile(configPath);

    if (!configResult)
    {
        gatelink::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!url.empty())
        config.gateway.url = url;
    if (!token.empty())
        config.gateway.token = token;
    if (!sessionKey.empty())
        config.session.key = sessionKey;
    if (node)
        config.node.enabled = true;
    if (verbose->count() > 0)
    {
        auto const raised = std::max(static_cast<int>(config.logLevel),
                                     static_cast<int>(gatelink::log::Level::Info) + static_cast<int>(verbose->count()));
        config.logLevel =
            static_cast<gatelink::log::Level>(std::min(raised, static_cast<int>(gatelink::log::Level::Trace)));
    }
    gatelink::log::setLevel(config.logLevel);

    auto application = gatelink::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        gatelink::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
