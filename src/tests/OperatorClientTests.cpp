// SPDX-License-Identifier: Apache-2.0
#include <gateway/OperatorClient.hpp>

#include "TestDoubles.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <variant>
#include <vector>

using namespace gatelink;

namespace
{
    struct Fixture
    {
        test::ManualScheduler scheduler;
        test::MockNetwork network;
        OperatorClient client { scheduler, network.factory() };
        std::vector<CanonicalEvent> events;

        Fixture()
        {
            client.addEventHandler([this](const CanonicalEvent& event) { events.push_back(event); });
        }

        auto connection() -> test::MockConnection& { return network.latest(); }

        void connect(nlohmann::ordered_json hello = { { "protocol", 3 } })
        {
            client.connect({ .url = "ws://gateway.test:18789" });
            connection().completeHandshake(std::move(hello));
            REQUIRE(client.session().state() == ConnectionState::Connected);
        }

        /// Replies to the most recent request.
        void reply(bool ok, nlohmann::ordered_json payloadOrError)
        {
            auto const id = connection().lastSent()["id"].get<std::string>();
            connection().receive(frame::makeResponse(id, ok, std::move(payloadOrError)));
        }
    };
} // namespace

TEST_CASE("OperatorClient declares the operator role", "[operator]")
{
    auto const profile = OperatorClient::makeProfile({});
    CHECK(profile.role == SessionRole::Operator);
    CHECK(profile.scopes == std::vector<std::string> { "operator.admin", "operator.approvals", "operator.pairing" });
    CHECK(profile.caps.empty());
}

TEST_CASE("OperatorClient chatSend starts a run", "[operator]")
{
    auto f = Fixture {};
    f.connect();

    auto run = std::optional<Result<ChatRun>> {};
    f.client.chatSend("main", "hello", [&](Result<ChatRun> r) { run = std::move(r); });

    auto const request = f.connection().lastSent();
    CHECK(request["method"] == "chat.send");
    CHECK(request["params"]["sessionKey"] == "main");
    CHECK(request["params"]["message"] == "hello");
    CHECK(request["params"]["idempotencyKey"].get<std::string>().size() == 36);
    CHECK(f.client.lastSessionKey() == "main");

    f.reply(true, { { "runId", "run-7" } });
    REQUIRE(run.has_value());
    REQUIRE(run->has_value());
    CHECK((*run)->runId == "run-7");
}

TEST_CASE("OperatorClient chatSend reports gateway errors", "[operator]")
{
    auto f = Fixture {};
    f.connect();

    auto run = std::optional<Result<ChatRun>> {};
    f.client.chatSend("main", "hello", [&](Result<ChatRun> r) { run = std::move(r); });
    f.reply(false, { { "message", "session busy" } });

    REQUIRE(run.has_value());
    REQUIRE(!run->has_value());
    CHECK(run->error().code == ErrorCode::CommandRejected);
    CHECK(run->error().message == "session busy");
}

TEST_CASE("OperatorClient chatAbort and chatHistory", "[operator]")
{
    auto f = Fixture {};
    f.connect();

    auto aborted = std::optional<VoidResult> {};
    f.client.chatAbort("main", "run-7", [&](VoidResult r) { aborted = std::move(r); });
    auto const abortParams = nlohmann::ordered_json { { "sessionKey", "main" }, { "runId", "run-7" } };
    CHECK(f.connection().lastSent()["params"] == abortParams);
    f.reply(true, nlohmann::ordered_json::object());
    REQUIRE(aborted.has_value());
    CHECK(aborted->has_value());

    auto history = std::optional<Result<std::vector<nlohmann::ordered_json>>> {};
    f.client.chatHistory("main", [&](auto r) { history = std::move(r); });
    CHECK(f.connection().lastSent()["method"] == "chat.history");

    SECTION("messages are returned in order")
    {
        f.reply(true,
                { { "messages",
                    nlohmann::ordered_json::array({ { { "role", "user" }, { "content", "hi" } },
                                            { { "role", "assistant" }, { "content", "hello" } } }) } });
        REQUIRE(history.has_value());
        REQUIRE(history->has_value());
        REQUIRE((*history)->size() == 2);
        CHECK((**history)[1]["role"] == "assistant");
    }

    SECTION("a payload without messages is an empty history")
    {
        f.reply(true, nlohmann::ordered_json::object());
        REQUIRE(history.has_value());
        REQUIRE(history->has_value());
        CHECK((*history)->empty());
    }
}

TEST_CASE("OperatorClient lists and creates sessions", "[operator]")
{
    auto f = Fixture {};
    f.connect();

    auto sessions = std::optional<Result<std::vector<Session>>> {};
    f.client.sessionList([&](auto r) { sessions = std::move(r); });
    CHECK(f.connection().lastSent()["method"] == "session.list");
    f.reply(true,
            { { "sessions",
                nlohmann::ordered_json::array({ { { "key", "main" }, { "agent", "coder" } },
                                        { { "label", "no key" } },
                                        { { "key", "scratch" }, { "createdAt", "2024-01-01" } } }) } });

    REQUIRE(sessions.has_value());
    REQUIRE(sessions->has_value());
    REQUIRE((*sessions)->size() == 2);
    CHECK((**sessions)[0].key == "main");
    CHECK((**sessions)[0].agent == "coder");
    CHECK((**sessions)[1].key == "scratch");
    CHECK((**sessions)[1].createdAt == "2024-01-01");

    auto created = std::optional<Result<Session>> {};
    f.client.sessionCreate("review", std::string("reviewer"), [&](Result<Session> r) { created = std::move(r); });
    auto const createParams = nlohmann::ordered_json { { "key", "review" }, { "agent", "reviewer" } };
    CHECK(f.connection().lastSent()["params"] == createParams);
    f.reply(true, { { "key", "review" }, { "agent", "reviewer" } });

    REQUIRE(created.has_value());
    REQUIRE(created->has_value());
    CHECK((*created)->key == "review");
}

TEST_CASE("OperatorClient sessionCreate omits an empty agent", "[operator]")
{
    auto f = Fixture {};
    f.connect();

    auto created = std::optional<Result<Session>> {};
    f.client.sessionCreate("plain", std::string {}, [&](Result<Session> r) { created = std::move(r); });
    CHECK(f.connection().lastSent()["params"] == nlohmann::ordered_json { { "key", "plain" } });

    f.reply(true, { { "label", "missing key" } });
    REQUIRE(created.has_value());
    CHECK(!created->has_value());
}

TEST_CASE("OperatorClient commands accept an empty callback", "[operator]")
{
    auto f = Fixture {};
    f.connect();

    f.client.chatSend("main", "hello", {});
    CHECK_NOTHROW(f.reply(true, { { "runId", "run-1" } }));

    f.client.chatAbort("main", "run-1", {});
    CHECK_NOTHROW(f.reply(true, nlohmann::ordered_json::object()));

    f.client.chatHistory("main", {});
    CHECK_NOTHROW(f.reply(true, { { "messages", nlohmann::ordered_json::array() } }));

    f.client.sessionList({});
    CHECK_NOTHROW(f.reply(true, { { "sessions", nlohmann::ordered_json::array() } }));

    f.client.sessionCreate("review", std::nullopt, {});
    CHECK_NOTHROW(f.reply(false, { { "message", "exists" } }));

    f.client.nodePairRequest({});
    CHECK_NOTHROW(f.reply(true, nlohmann::ordered_json::object()));
}

TEST_CASE("OperatorClient nodePairRequest announces the canvas capability", "[operator]")
{
    auto f = Fixture {};
    f.connect();

    auto paired = std::optional<Result<nlohmann::ordered_json>> {};
    f.client.nodePairRequest([&](Result<nlohmann::ordered_json> r) { paired = std::move(r); });

    auto const params = f.connection().lastSent()["params"];
    CHECK(f.connection().lastSent()["method"] == "node.pair.request");
    CHECK(params["nodeId"].get<std::string>().size() == 36);
    CHECK(params["caps"] == nlohmann::ordered_json::array({ "canvas" }));
    CHECK(params["commands"] == nlohmann::ordered_json::array({ "canvas.present" }));

    f.reply(true, { { "status", "pending" } });
    REQUIRE(paired.has_value());
    REQUIRE(paired->has_value());
    CHECK((**paired)["status"] == "pending");
}

TEST_CASE("OperatorClient exposes the announced canvas host", "[operator]")
{
    auto f = Fixture {};
    CHECK(!f.client.canvasHostUrl());

    f.connect({ { "protocol", 3 }, { "canvasHostUrl", "http://127.0.0.1:18793" } });
    CHECK(f.client.canvasHostUrl() == "http://127.0.0.1:18793");
}

TEST_CASE("OperatorClient delivers translated events", "[operator]")
{
    auto f = Fixture {};
    f.connect();

    f.connection().receive(
        frame::makeEvent("agent", { { "stream", "assistant" }, { "data", { { "delta", "Hi" } } } }, 1));
    f.connection().receive(frame::makeEvent("tick", { { "ts", 1 } }));
    f.connection().receive(frame::makeEvent("chat", { { "state", "final" } }, 2));

    REQUIRE(f.events.size() == 2);
    CHECK(std::get<TextFragment>(f.events[0].payload).content == "Hi");
    CHECK(f.events[0].seq == 1);
    CHECK(std::get<Completion>(f.events[1].payload).stopReason == "end_turn");
}

TEST_CASE("OperatorClient stops delivering to removed handlers", "[operator]")
{
    auto f = Fixture {};
    auto count = 0;
    auto const id = f.client.addEventHandler([&](const CanonicalEvent&) { ++count; });
    f.connect();

    f.connection().receive(frame::makeEvent("chat", { { "state", "final" } }));
    f.client.removeEventHandler(id);
    f.connection().receive(frame::makeEvent("chat", { { "state", "final" } }));

    CHECK(count == 1);
    CHECK(f.events.size() == 2);
}

TEST_CASE("sessionFromJson requires a key", "[operator]")
{
    auto session = sessionFromJson({ { "key", "k" }, { "label", "Label" } });
    REQUIRE(session.has_value());
    CHECK(session->label == "Label");
    CHECK(!session->agent);

    CHECK(!sessionFromJson({ { "agent", "a" } }));
    CHECK(!sessionFromJson(nlohmann::ordered_json::array()));
}
