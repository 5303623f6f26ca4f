// SPDX-License-Identifier: Apache-2.0
#include <gatelink/Config.hpp>

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace gatelink;

namespace
{
    auto writeTempConfig(std::string_view name, std::string_view contents) -> std::filesystem::path
    {
        auto const path = std::filesystem::temp_directory_path() / name;
        auto file = std::ofstream(path);
        file << contents;
        return path;
    }
} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
    REQUIRE(path.starts_with(defaultConfigDir()));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.gateway.url == "ws://127.0.0.1:18789");
    CHECK(!config.gateway.token);
    CHECK(!config.device.isConfigured());
    CHECK(config.session.key == "main");
    CHECK(!config.session.agent);
    CHECK(config.node.enabled == false);
    CHECK(config.logLevel == log::Level::Info);
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempConfig("gatelink_test_config.json", R"({
            "gateway": {
                "url": "wss://gateway.example.com/ws",
                "token": "secret"
            },
            "device": {
                "publicKey": "d75a98",
                "privateKey": "302e02"
            },
            "session": {
                "key": "work",
                "agent": "coder"
            },
            "node": {
                "enabled": true
            },
            "logLevel": "debug"
        })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Gateway config")
    {
        CHECK(config.gateway.url == "wss://gateway.example.com/ws");
        CHECK(config.gateway.token == "secret");
    }

    SECTION("Device config")
    {
        CHECK(config.device.isConfigured());
        CHECK(config.device.publicKey == "d75a98");
        CHECK(config.device.privateKey == "302e02");
    }

    SECTION("Session and node config")
    {
        CHECK(config.session.key == "work");
        CHECK(config.session.agent == "coder");
        CHECK(config.node.enabled == true);
        CHECK(config.logLevel == log::Level::Debug);
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for missing sections", "[config]")
{
    auto const tempPath = writeTempConfig("gatelink_test_partial.json", R"({ "gateway": { "token": "t" } })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->gateway.url == "ws://127.0.0.1:18789");
    CHECK(result->gateway.token == "t");
    CHECK(result->session.key == "main");
    CHECK(!result->device.isConfigured());
    CHECK(result->logLevel == log::Level::Info);

    std::filesystem::remove(tempPath);
}

TEST_CASE("DeviceConfig requires both keys", "[config]")
{
    auto const tempPath = writeTempConfig("gatelink_test_half_device.json", R"({ "device": { "publicKey": "ab" } })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(!result->device.isConfigured());

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(result.error().message == "Cannot open config file: /nonexistent/path/config.json");
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("gatelink_test_invalid.json", "{ invalid json }}}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(result.error().message.starts_with(tempPath.string()));

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects a non-object document", "[config]")
{
    auto const tempPath = writeTempConfig("gatelink_test_array.json", "[1, 2]");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects an unknown log level", "[config]")
{
    auto const tempPath = writeTempConfig("gatelink_test_level.json", R"({ "logLevel": "loud" })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().message.ends_with("unknown logLevel 'loud'"));

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a valid config that can be loaded back", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "gatelink_test_save";
    auto const tempPath = tempDir / "nested" / "config.json";

    auto config = AppConfig {};
    config.gateway.url = "ws://10.0.0.2:18789";
    config.gateway.token = "secret";
    config.device.publicKey = "d75a98";
    config.device.privateKey = "302e02";
    config.session.key = "review";
    config.session.agent = "reviewer";
    config.node.enabled = true;
    config.logLevel = log::Level::Warning;

    auto saveResult = saveConfigToFile(tempPath.string(), config);
    REQUIRE(saveResult.has_value());

    auto loadResult = loadConfigFromFile(tempPath.string());
    REQUIRE(loadResult.has_value());

    auto const& loaded = *loadResult;
    CHECK(loaded.gateway.url == "ws://10.0.0.2:18789");
    CHECK(loaded.gateway.token == "secret");
    CHECK(loaded.device.publicKey == "d75a98");
    CHECK(loaded.device.privateKey == "302e02");
    CHECK(loaded.session.key == "review");
    CHECK(loaded.session.agent == "reviewer");
    CHECK(loaded.node.enabled == true);
    CHECK(loaded.logLevel == log::Level::Warning);

    std::filesystem::remove_all(tempDir);
}

TEST_CASE("saveConfigToFile with defaults omits optional values", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "gatelink_test_save_defaults.json";

    auto saveResult = saveConfigToFile(tempPath.string(), AppConfig {});
    REQUIRE(saveResult.has_value());

    {
        auto file = std::ifstream(tempPath);
        auto const written = nlohmann::ordered_json::parse(file);
        CHECK(!written.contains("device"));
        CHECK(!written["gateway"].contains("token"));
        CHECK(written["logLevel"] == "info");
    }

    auto loadResult = loadConfigFromFile(tempPath.string());
    REQUIRE(loadResult.has_value());
    CHECK(loadResult->gateway.url == "ws://127.0.0.1:18789");
    CHECK(loadResult->session.key == "main");
    CHECK(loadResult->node.enabled == false);

    std::filesystem::remove(tempPath);
}
