#include "mcp/RelayServer.hpp"
#include "core/Errors.hpp"
#include "StubProcess.hpp"
#include <gtest/gtest.h>
#include <httplib.h>

using namespace mcp_relay;
using namespace std::chrono_literals;

class RelayServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        context = std::make_shared<SessionContext>(5000ms);
        RelayOptions options;
        options.port = 0;
        options.forward_timeout = 5000ms;
        relay = std::make_unique<RelayServer>(context, options);
    }

    void TearDown() override {
        relay->stop();
    }

    void bind_stub(std::vector<std::string> extra_args = {}) {
        context->bind(stub.start(std::move(extra_args)));
    }

    httplib::Client client() {
        httplib::Client c("127.0.0.1", relay->port());
        c.set_read_timeout(5, 0);
        return c;
    }

    StubProcess stub;
    std::shared_ptr<SessionContext> context;
    std::unique_ptr<RelayServer> relay;
};

TEST_F(RelayServerTest, StartBindsFreePort) {
    relay->start();
    EXPECT_TRUE(relay->is_running());
    EXPECT_GT(relay->port(), 0);
    EXPECT_EQ(relay->endpoint().host, "127.0.0.1");
    EXPECT_EQ(relay->endpoint().port, relay->port());
}

TEST_F(RelayServerTest, StartTwiceThrows) {
    relay->start();
    EXPECT_THROW(relay->start(), RelayError);
}

TEST_F(RelayServerTest, StopIsIdempotent) {
    relay->start();
    relay->stop();
    EXPECT_FALSE(relay->is_running());
    EXPECT_EQ(relay->port(), 0);
    EXPECT_NO_THROW(relay->stop());
}

TEST_F(RelayServerTest, PostForwardsRequest) {
    bind_stub();
    relay->start();

    json request = {{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/list"}, {"params", json::object()}};
    auto res = client().Post("/mcp", request.dump(), "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["id"], 7);
    ASSERT_TRUE(body["result"]["tools"].is_array());
    EXPECT_EQ(body["result"]["tools"][0]["name"], "echo");
}

TEST_F(RelayServerTest, NotificationIsAccepted) {
    bind_stub();
    relay->start();

    json notification = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    auto res = client().Post("/mcp", notification.dump(), "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["result"], "accepted");
}

TEST_F(RelayServerTest, InvalidJsonIsBadRequest) {
    bind_stub();
    relay->start();

    auto res = client().Post("/mcp", "{not json", "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["type"], "invalid_request");
}

TEST_F(RelayServerTest, EnvelopeWithoutMethodIsBadRequest) {
    bind_stub();

    auto reply = relay->handle_envelope(R"({"jsonrpc":"2.0","id":1})");

    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["type"], "invalid_request");
}

TEST_F(RelayServerTest, UnknownPathIsNotFound) {
    relay->start();

    auto res = client().Post("/other", "{}", "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(json::parse(res->body)["type"], "not_found");
}

TEST_F(RelayServerTest, OptionsAnswersCorsPreflight) {
    relay->start();

    auto res = client().Options("/mcp");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "POST, OPTIONS");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "Content-Type");
}

TEST_F(RelayServerTest, UnboundContextIsUnavailable) {
    relay->start();

    auto res = client().Post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"ping"})", "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    EXPECT_EQ(json::parse(res->body)["type"], "unavailable");
}

TEST_F(RelayServerTest, TransportFailureIsServerError) {
    bind_stub({"--malformed-on", "bad"});

    auto reply = relay->handle_envelope(R"({"jsonrpc":"2.0","id":1,"method":"bad"})");

    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.body["type"], "transport_error");
}

TEST_F(RelayServerTest, RebindServesNewProcess) {
    bind_stub();
    relay->start();
    auto first_pid = context->process()->pid();
    unsigned generation = context->generation();

    stub.supervisor().stop(*context->process());
    bind_stub();
    EXPECT_NE(context->process()->pid(), first_pid);
    EXPECT_EQ(context->generation(), generation + 1);

    auto res = client().Post("/mcp", R"({"jsonrpc":"2.0","id":3,"method":"ping"})", "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["result"]["method"], "ping");
}
