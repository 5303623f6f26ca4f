// SPDX-License-Identifier: Apache-2.0
#include <gateway/NodeClient.hpp>

#include "TestDoubles.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

using namespace gatelink;

namespace
{
    struct Fixture
    {
        test::ManualScheduler scheduler;
        test::MockNetwork network;
        test::RecordingRendering rendering;
        NodeClient client { scheduler, network.factory(), rendering };

        auto connection() -> test::MockConnection& { return network.latest(); }

        void connect()
        {
            client.connect({ .url = "ws://gateway.test:18789", .token = "node-token" });
            connection().completeHandshake();
            REQUIRE(client.session().state() == ConnectionState::Connected);
        }

        /// Pushes an invoke request and returns the params of the reported result.
        auto invoke(std::string command, const nlohmann::ordered_json& params) -> nlohmann::ordered_json
        {
            auto payload = nlohmann::ordered_json {
                { "id", "inv-1" },
                { "nodeId", "node-a" },
                { "command", std::move(command) },
            };
            if (!params.is_null())
                payload["paramsJSON"] = params.dump();

            auto const before = connection().sent.size();
            connection().receive(frame::makeEvent("node.invoke.request", payload));
            REQUIRE(connection().sent.size() == before + 1);

            auto const request = connection().lastSent();
            REQUIRE(request["method"] == "node.invoke.result");
            return request["params"];
        }
    };
} // namespace

TEST_CASE("NodeClient declares the canvas capability", "[node]")
{
    auto const profile = NodeClient::makeProfile({});
    CHECK(profile.role == SessionRole::Node);
    CHECK(profile.scopes.empty());
    CHECK(profile.caps == std::vector<std::string> { "canvas" });
    CHECK(std::ranges::find(profile.commands, std::string("canvas.a2ui.pushJSONL")) != profile.commands.end());

    auto f = Fixture {};
    f.connect();
    auto const handshake = f.connection().sentFrame(0)["params"];
    CHECK(handshake["role"] == "node");
    CHECK(handshake["caps"] == nlohmann::ordered_json::array({ "canvas" }));
    CHECK(handshake["client"]["mode"] == "cli");
}

TEST_CASE("NodeClient applies pushed UI messages to the rendering sink", "[node]")
{
    auto f = Fixture {};
    f.connect();

    auto const messages = nlohmann::ordered_json::array({
        { { "type", "text" }, { "text", "hello" } },
        { { "deleteSurface", { { "surfaceId", "old" } } } },
    });
    auto const result = f.invoke("canvas.a2ui.push", { { "messages", messages } });

    CHECK(result["id"] == "inv-1");
    CHECK(result["nodeId"] == "node-a");
    CHECK(result["ok"] == true);
    CHECK(result["payloadJSON"].is_null());
    CHECK(result["error"].is_null());

    REQUIRE(f.rendering.batches.size() == 1);
    auto const& operations = f.rendering.batches[0];
    REQUIRE(operations.size() == 3);
    CHECK(operations[0].contains("surfaceUpdate"));
    CHECK(operations[1]["beginRendering"]["root"] == "root_2");
    CHECK(operations[2]["deleteSurface"]["surfaceId"] == "old");
}

TEST_CASE("NodeClient converts pushed JSONL", "[node]")
{
    auto f = Fixture {};
    f.connect();

    auto const result = f.invoke(
        "canvas.a2ui.pushJSONL",
        { { "jsonl", "{\"type\":\"text\",\"text\":\"a\"}\n{\"type\":\"progress\",\"value\":25,\"max\":50}\n" } });

    CHECK(result["ok"] == true);
    REQUIRE(f.rendering.batches.size() == 1);
    auto const& components = f.rendering.batches[0].at(0)["surfaceUpdate"]["components"];
    CHECK(components.size() == 4);
}

TEST_CASE("NodeClient resets the default surface", "[node]")
{
    auto f = Fixture {};
    f.connect();

    auto const result = f.invoke("canvas.a2ui.reset", nullptr);
    CHECK(result["ok"] == true);
    REQUIRE(f.rendering.batches.size() == 1);
    auto const reset = nlohmann::ordered_json { { "deleteSurface", { { "surfaceId", "main" } } } };
    CHECK(f.rendering.batches[0] == std::vector<nlohmann::ordered_json> { reset });
}

TEST_CASE("NodeClient rejects malformed canvas commands", "[node]")
{
    auto f = Fixture {};
    f.connect();

    SECTION("push without messages")
    {
        auto const result = f.invoke("canvas.a2ui.push", { { "message", "x" } });
        CHECK(result["ok"] == false);
        CHECK(result["error"]["message"] == "canvas.a2ui.push requires a messages array");
    }

    SECTION("pushJSONL without text")
    {
        auto const result = f.invoke("canvas.a2ui.pushJSONL", nullptr);
        CHECK(result["ok"] == false);
    }

    CHECK(f.rendering.batches.empty());
}

TEST_CASE("NodeClient forwards other commands to the invoke handler", "[node]")
{
    auto f = Fixture {};
    f.connect();

    SECTION("without a handler")
    {
        auto const result = f.invoke("canvas.snapshot", nullptr);
        CHECK(result["ok"] == false);
        CHECK(result["error"]["message"] == "no handler for canvas.snapshot");
    }

    SECTION("handler result becomes the payload")
    {
        auto seenCommand = std::string {};
        auto seenParams = nlohmann::ordered_json {};
        f.client.setInvokeHandler(
            [&](std::string_view command, const nlohmann::ordered_json& params) -> Result<nlohmann::ordered_json> {
                seenCommand = std::string(command);
                seenParams = params;
                return nlohmann::ordered_json { { "visible", true } };
            });

        auto const result = f.invoke("canvas.present", { { "url", "http://h/" } });
        CHECK(seenCommand == "canvas.present");
        CHECK(seenParams["url"] == "http://h/");
        CHECK(result["ok"] == true);
        CHECK(nlohmann::ordered_json::parse(result["payloadJSON"].get<std::string>())["visible"] == true);
    }

    SECTION("handler errors are reported")
    {
        f.client.setInvokeHandler(
            [](std::string_view, const nlohmann::ordered_json&) -> Result<nlohmann::ordered_json> {
                return makeError(ErrorCode::InvalidArgument, "unsupported");
            });

        auto const result = f.invoke("canvas.eval", { { "javaScript", "1" } });
        CHECK(result["ok"] == false);
        CHECK(result["error"]["message"] == "unsupported");
    }
}

TEST_CASE("NodeClient ignores conversation broadcasts and malformed requests", "[node]")
{
    auto f = Fixture {};
    f.connect();
    auto const sentBefore = f.connection().sent.size();

    f.connection().receive(frame::makeEvent("chat", { { "state", "final" } }));
    f.connection().receive(frame::makeEvent("node.invoke.request", { { "nodeId", "node-a" } }));

    CHECK(f.connection().sent.size() == sentBefore);
    CHECK(f.rendering.batches.empty());
}

TEST_CASE("invokeRequestFromJson decodes the params string", "[node]")
{
    auto request = invokeRequestFromJson(
        { { "id", "1" }, { "nodeId", "n" }, { "command", "canvas.navigate" }, { "paramsJSON", "{\"url\":\"x\"}" } });
    REQUIRE(request.has_value());
    CHECK(request->params["url"] == "x");

    auto broken = invokeRequestFromJson({ { "id", "2" }, { "command", "canvas.hide" }, { "paramsJSON", "{oops" } });
    REQUIRE(broken.has_value());
    CHECK(broken->params.is_null());
    CHECK(broken->nodeId.empty());

    CHECK(!invokeRequestFromJson({ { "command", "canvas.hide" } }));
}
