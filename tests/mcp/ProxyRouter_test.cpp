#include "mcp/ProxyRouter.hpp"
#include "mcp/RelayServer.hpp"
#include "core/Errors.hpp"
#include "StubProcess.hpp"
#include <gtest/gtest.h>

using namespace mcp_relay;
using namespace std::chrono_literals;

class ProxyRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        context = std::make_shared<SessionContext>(5000ms);
        context->bind(stub.start());

        RelayOptions relay_options;
        relay_options.port = 0;
        relay = std::make_unique<RelayServer>(context, relay_options);
        relay->start();
    }

    void TearDown() override {
        relay->stop();
    }

    std::shared_ptr<ProxyRouter> make_router(bool use_proxy = false,
                                             const std::string& proxy_url = "http://127.0.0.1:8080") {
        RouterOptions options;
        options.relay = relay->endpoint();
        options.use_inspection_proxy = use_proxy;
        options.proxy_url = proxy_url;
        options.notification_timeout = 2000ms;
        options.request_timeout = 5000ms;
        return std::make_shared<ProxyRouter>(context, options);
    }

    StubProcess stub;
    std::shared_ptr<SessionContext> context;
    std::unique_ptr<RelayServer> relay;
};

TEST_F(ProxyRouterTest, CallGoesThroughRelay) {
    auto router = make_router();

    json response = router->call("ping", {{"value", 1}});

    EXPECT_EQ(router->last_route(), Route::DIRECT_RELAY);
    EXPECT_EQ(response["result"]["method"], "ping");
    EXPECT_EQ(response["result"]["params"]["value"], 1);
}

TEST_F(ProxyRouterTest, StoppedRelayFallsBackToStdio) {
    auto router = make_router();
    relay->stop();

    json response = router->call("tools/list", json::object());

    EXPECT_EQ(router->last_route(), Route::STDIO_FALLBACK);
    ASSERT_TRUE(response["result"]["tools"].is_array());
    EXPECT_EQ(response["result"]["tools"][0]["name"], "echo");
}

TEST_F(ProxyRouterTest, UnreachableProxyFallsBackToStdio) {
    auto router = make_router(true, "http://127.0.0.1:1");

    json response = router->call("ping", json::object());

    EXPECT_EQ(router->last_route(), Route::STDIO_FALLBACK);
    EXPECT_EQ(response["result"]["method"], "ping");
}

TEST_F(ProxyRouterTest, DisabledRelayUsesStdio) {
    auto router = make_router();
    router->set_relay_enabled(false);

    json response = router->call("ping", json::object());

    EXPECT_EQ(router->last_route(), Route::STDIO_FALLBACK);
    EXPECT_EQ(response["result"]["method"], "ping");
}

TEST_F(ProxyRouterTest, NotifyThroughRelay) {
    auto router = make_router();

    router->notify("notifications/initialized", json::object());
    EXPECT_EQ(router->last_route(), Route::DIRECT_RELAY);

    json response = router->call("ping", json::object());
    EXPECT_EQ(response["result"]["method"], "ping");
}

TEST_F(ProxyRouterTest, NotifyFallsBackWhenRelayStopped) {
    auto router = make_router();
    relay->stop();

    router->notify("notifications/initialized", json::object());

    EXPECT_EQ(router->last_route(), Route::STDIO_FALLBACK);
}

TEST_F(ProxyRouterTest, UnboundContextThrowsClosed) {
    auto router = make_router();
    context->unbind();

    EXPECT_FALSE(router->is_open());
    try {
        router->call("ping", json::object());
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportError::Kind::Closed);
    }
}

TEST_F(ProxyRouterTest, InvalidProxyUrlRejected) {
    EXPECT_THROW(make_router(true, "socks5://127.0.0.1:1080"), std::invalid_argument);

    auto router = make_router(false, "not a url:");
    EXPECT_THROW(router->set_use_inspection_proxy(true), std::invalid_argument);
}
