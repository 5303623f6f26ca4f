// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace gatelink
{

/// @brief Gateway endpoint configuration section.
struct GatewayConfig
{
    std::string url = "ws://127.0.0.1:18789";
    std::optional<std::string> token;
};

/// @brief Device identity key material, hex encoded.
///
/// Both keys must be set for the handshake to carry a device assertion.
struct DeviceConfig
{
    std::string publicKey;
    std::string privateKey;

    [[nodiscard]] auto isConfigured() const noexcept -> bool { return !publicKey.empty() && !privateKey.empty(); }
};

/// @brief Conversation defaults.
struct ConversationConfig
{
    std::string key = "main";
    std::optional<std::string> agent;
};

/// @brief Canvas node configuration section.
struct NodeConfig
{
    bool enabled = false;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    GatewayConfig gateway;
    DeviceConfig device;
    ConversationConfig session;
    NodeConfig node;
    log::Level logLevel = log::Level::Info;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, the defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/gatelink or ~/.config/gatelink
/// On macOS: ~/Library/Application Support/gatelink
/// On Windows: %APPDATA%\gatelink
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace gatelink
