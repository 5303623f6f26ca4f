// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace gatelink
{

namespace
{
    constexpr auto levelName(log::Level level) -> std::string_view
    {
        switch (level)
        {
            case log::Level::Error: return "error";
            case log::Level::Warning: return "warning";
            case log::Level::Info: return "info";
            case log::Level::Debug: return "debug";
            case log::Level::Trace: return "trace";
        }
        return "info";
    }
} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\gatelink";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/gatelink";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/gatelink";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/gatelink";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: top-level value must be an object", path));

    auto config = AppConfig {};

    if (auto const* gateway = json::find(root, "gateway"))
    {
        config.gateway.url = json::getStringOr(*gateway, "url", config.gateway.url);
        config.gateway.token = json::getOptionalString(*gateway, "token");
    }

    if (auto const* device = json::find(root, "device"))
    {
        config.device.publicKey = json::getStringOr(*device, "publicKey", "");
        config.device.privateKey = json::getStringOr(*device, "privateKey", "");
    }

    if (auto const* session = json::find(root, "session"))
    {
        config.session.key = json::getStringOr(*session, "key", config.session.key);
        config.session.agent = json::getOptionalString(*session, "agent");
    }

    if (auto const* node = json::find(root, "node"))
        config.node.enabled = json::getBoolOr(*node, "enabled", false);

    if (auto const name = json::getOptionalString(root, "logLevel"))
    {
        auto const level = log::levelFromString(*name);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("{}: unknown logLevel '{}'", path, *name));
        config.logLevel = *level;
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::ordered_json::object();

    auto gateway = nlohmann::ordered_json::object();
    gateway["url"] = config.gateway.url;
    if (config.gateway.token)
        gateway["token"] = *config.gateway.token;
    root["gateway"] = std::move(gateway);

    if (config.device.isConfigured())
    {
        root["device"] = {
            { "publicKey", config.device.publicKey },
            { "privateKey", config.device.privateKey },
        };
    }

    auto session = nlohmann::ordered_json::object();
    session["key"] = config.session.key;
    if (config.session.agent)
        session["agent"] = *config.session.agent;
    root["session"] = std::move(session);

    root["node"] = { { "enabled", config.node.enabled } };
    root["logLevel"] = levelName(config.logLevel);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace gatelink
