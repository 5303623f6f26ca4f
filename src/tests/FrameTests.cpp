// SPDX-License-Identifier: Apache-2.0
#include <protocol/Frame.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace gatelink;

TEST_CASE("makeRequest creates a request frame", "[frame]")
{
    auto request = frame::makeRequest("cmd_1", "chat.send", { { "sessionKey", "main" } });

    CHECK(request["type"] == "req");
    CHECK(request["id"] == "cmd_1");
    CHECK(request["method"] == "chat.send");
    CHECK(request["params"]["sessionKey"] == "main");
}

TEST_CASE("makeRequest always sends a params object", "[frame]")
{
    auto request = frame::makeRequest("cmd_2", "session.list");
    CHECK(request["params"] == nlohmann::ordered_json::object());
}

TEST_CASE("parse handles event frames", "[frame]")
{
    auto msg = nlohmann::ordered_json {
        { "type", "event" },
        { "event", "agent" },
        { "payload", { { "stream", "assistant" } } },
        { "seq", 17 },
    };

    auto result = frame::parse(msg);
    REQUIRE(result.has_value());
    auto const* event = std::get_if<frame::Event>(&*result);
    REQUIRE(event != nullptr);
    CHECK(event->name == "agent");
    CHECK(event->payload["stream"] == "assistant");
    CHECK(event->seq == 17);
}

TEST_CASE("parse defaults missing event payload and seq", "[frame]")
{
    auto result = frame::parse({ { "type", "event" }, { "event", "tick" } });
    REQUIRE(result.has_value());
    auto const& event = std::get<frame::Event>(*result);
    CHECK(event.payload == nlohmann::ordered_json::object());
    CHECK(!event.seq);
}

TEST_CASE("parse accepts whole-valued float sequence numbers", "[frame]")
{
    auto whole = frame::parseText(R"({"type":"event","event":"agent","payload":{},"seq":5.0})");
    REQUIRE(whole.has_value());
    CHECK(std::get<frame::Event>(*whole).seq == 5);

    auto fractional = frame::parseText(R"({"type":"event","event":"agent","payload":{},"seq":5.5})");
    REQUIRE(fractional.has_value());
    CHECK(!std::get<frame::Event>(*fractional).seq);

    auto text = frame::parseText(R"({"type":"event","event":"agent","payload":{},"seq":"5"})");
    REQUIRE(text.has_value());
    CHECK(!std::get<frame::Event>(*text).seq);
}

TEST_CASE("parseText keeps payload keys in the order they were sent", "[frame]")
{
    auto result = frame::parseText(R"({"type":"event","event":"agent","payload":{"zeta":1,"alpha":2,"mid":3}})");
    REQUIRE(result.has_value());

    auto keys = std::vector<std::string> {};
    for (auto const& [key, value]: std::get<frame::Event>(*result).payload.items())
        keys.push_back(key);
    CHECK(keys == std::vector<std::string> { "zeta", "alpha", "mid" });
}

TEST_CASE("parse handles response frames", "[frame]")
{
    SECTION("success")
    {
        auto result = frame::parseText(R"({"type":"res","id":"cmd_3","ok":true,"payload":{"runId":"r1"}})");
        REQUIRE(result.has_value());
        auto const& response = std::get<frame::Response>(*result);
        CHECK(response.id == "cmd_3");
        CHECK(response.ok);
        REQUIRE(response.payload.has_value());
        CHECK((*response.payload)["runId"] == "r1");
    }

    SECTION("failure")
    {
        auto result = frame::parseText(R"({"type":"res","id":"connect","ok":false,"error":{"message":"bad token"}})");
        REQUIRE(result.has_value());
        auto const& response = std::get<frame::Response>(*result);
        CHECK(!response.ok);
        CHECK(!response.payload);
        CHECK(frame::formatError(response.error) == "bad token");
    }

    SECTION("ok defaults to false")
    {
        auto result = frame::parse({ { "type", "res" }, { "id", "x" } });
        REQUIRE(result.has_value());
        CHECK(!std::get<frame::Response>(*result).ok);
    }
}

TEST_CASE("parse handles request frames", "[frame]")
{
    auto result = frame::parse(frame::makeRequest("connect", "connect", { { "minProtocol", 3 } }));
    REQUIRE(result.has_value());
    auto const& request = std::get<frame::Request>(*result);
    CHECK(request.id == "connect");
    CHECK(request.params["minProtocol"] == 3);
}

TEST_CASE("parse rejects malformed frames", "[frame]")
{
    CHECK(frame::parse(nlohmann::ordered_json::array()).error().code == ErrorCode::ParseError);
    CHECK(!frame::parse({ { "type", "event" } }));
    CHECK(!frame::parse({ { "type", "res" }, { "ok", true } }));
    CHECK(!frame::parse({ { "type", "req" }, { "id", "1" } }));
    CHECK(frame::parse({ { "type", "hello" } }).error().message == "Unknown frame type 'hello'");
    CHECK(!frame::parseText("{not json"));
}

TEST_CASE("formatError", "[frame]")
{
    CHECK(frame::formatError({ { "message", "denied" }, { "code", 4 } }) == "denied");
    CHECK(frame::formatError("plain") == "plain");
    CHECK(frame::formatError(nullptr) == "Unknown error");
    CHECK(frame::formatError({ { "code", 4 } }) == R"({"code":4})");
    CHECK(frame::formatError(42) == "42");
}
