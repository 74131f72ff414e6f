#include "core/Errors.hpp"
#include "core/ServerConfig.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace mcp_relay;
namespace fs = std::filesystem;

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::path test_dir = fs::path(__FILE__).parent_path();
        fixtures_dir = test_dir / ".." / "fixtures";
        ASSERT_TRUE(fs::exists(fixtures_dir)) << "Fixtures directory not found";
    }

    fs::path fixtures_dir;
};

TEST_F(ServerConfigTest, LoadsServersInFileOrder) {
    auto config = ServerConfig::load(fixtures_dir / "mcp_config.json");

    ASSERT_EQ(config.size(), 3);
    auto names = config.list_servers();
    EXPECT_EQ(names, (std::vector<std::string>{"stub", "github", "fetch"}));
}

TEST_F(ServerConfigTest, LaunchSpecFields) {
    auto config = ServerConfig::load(fixtures_dir / "mcp_config.json");

    auto github = config.get("github");
    ASSERT_TRUE(github.has_value());
    EXPECT_EQ(github->name, "github");
    EXPECT_EQ(github->command, "npx");
    EXPECT_EQ(github->args, (std::vector<std::string>{"-y", "@modelcontextprotocol/server-github"}));
    EXPECT_EQ(github->env.at("GITHUB_PERSONAL_ACCESS_TOKEN"), "<token>");

    auto fetch = config.get("fetch");
    ASSERT_TRUE(fetch.has_value());
    EXPECT_TRUE(fetch->env.empty());
}

TEST_F(ServerConfigTest, UnknownServerIsEmpty) {
    auto config = ServerConfig::load(fixtures_dir / "mcp_config.json");
    EXPECT_FALSE(config.get("nonexistent").has_value());
}

TEST_F(ServerConfigTest, MissingFileThrows) {
    EXPECT_THROW(ServerConfig::load(fixtures_dir / "does_not_exist.json"), ConfigError);
}

TEST(ServerConfigJsonTest, MissingCommandThrows) {
    auto document = nlohmann::ordered_json::parse(R"({"mcpServers": {"broken": {"args": []}}})");
    EXPECT_THROW(ServerConfig::from_json(document), ConfigError);
}

TEST(ServerConfigJsonTest, NoServersSectionIsEmpty) {
    auto config = ServerConfig::from_json(nlohmann::ordered_json::parse(R"({"other": 1})"));
    EXPECT_TRUE(config.empty());
}

TEST(ParseHttpUrlTest, HostAndPort) {
    auto endpoint = parse_http_url("http://127.0.0.1:8080");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "127.0.0.1");
    EXPECT_EQ(endpoint->port, 8080);
}

TEST(ParseHttpUrlTest, DefaultsAndPath) {
    auto endpoint = parse_http_url("localhost/mcp");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "localhost");
    EXPECT_EQ(endpoint->port, 80);
}

TEST(ParseHttpUrlTest, RejectsUnusableUrls) {
    EXPECT_FALSE(parse_http_url("https://example.com").has_value());
    EXPECT_FALSE(parse_http_url("http://host:notaport").has_value());
    EXPECT_FALSE(parse_http_url("http://:8080").has_value());
    EXPECT_FALSE(parse_http_url("").has_value());
}
