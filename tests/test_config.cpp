#include <gtest/gtest.h>
#include "client/client_config.hpp"

#include <cstdio>
#include <fstream>

using namespace relaysync;
using namespace relaysync::client;

TEST(ConfigTest, Defaults) {
    RelayClientConfig config;
    EXPECT_EQ(config.session_endpoint, "/api/sessions");
    EXPECT_TRUE(config.auto_reconnect);
    EXPECT_EQ(config.max_reconnect_attempts, 5u);
    EXPECT_EQ(config.reconnect_delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.connection_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.request_timeout, std::chrono::milliseconds(10000));
    EXPECT_FALSE(config.ssl_verify);
    EXPECT_FALSE(config.event_handler);
}

TEST(ConfigTest, ParseFull) {
    auto config = RelayClientConfig::parse(R"({
        "server": { "url": "wss://relay.example.com/ws", "session_endpoint": "/v2/sessions" },
        "reconnect": { "enabled": false, "max_attempts": 2, "delay_ms": 250 },
        "connection_timeout_ms": 1500,
        "request_timeout_ms": 3000,
        "tls": { "verify": true },
        "user_agent": "tests/0.1",
        "log": { "level": "debug", "file": "/tmp/relaysync.log" }
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server_url, "wss://relay.example.com/ws");
    EXPECT_EQ(config->session_endpoint, "/v2/sessions");
    EXPECT_FALSE(config->auto_reconnect);
    EXPECT_EQ(config->max_reconnect_attempts, 2u);
    EXPECT_EQ(config->reconnect_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(config->connection_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(config->request_timeout, std::chrono::milliseconds(3000));
    EXPECT_TRUE(config->ssl_verify);
    EXPECT_EQ(config->user_agent, "tests/0.1");
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->log_file, "/tmp/relaysync.log");
}

TEST(ConfigTest, ParseKeepsDefaultsForAbsentFields) {
    auto config = RelayClientConfig::parse(R"({"server": {"url": "ws://localhost:8080/ws"}})");
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->auto_reconnect);
    EXPECT_EQ(config->max_reconnect_attempts, 5u);
    EXPECT_EQ(config->session_endpoint, "/api/sessions");
}

TEST(ConfigTest, ParseErrors) {
    EXPECT_EQ(RelayClientConfig::parse("not json").error(), ConfigError::PARSE_ERROR);
    EXPECT_EQ(RelayClientConfig::parse("[]").error(), ConfigError::PARSE_ERROR);
    EXPECT_EQ(RelayClientConfig::parse(R"({"reconnect": {"max_attempts": "three"}})").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(RelayClientConfig::parse(R"({"reconnect": {"delay_ms": -5}})").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(RelayClientConfig::parse(R"({"log": {"level": "loud"}})").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(RelayClientConfig::parse(R"({"server": {"url": "http://localhost/ws"}})").error(),
              ConfigError::INVALID_VALUE);
}

TEST(ConfigTest, UrlMayComeLater) {
    auto config = RelayClientConfig::parse(R"({"reconnect": {"max_attempts": 1}})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->validate().error(), ConfigError::MISSING_REQUIRED);

    config->server_url = "ws://localhost:9999";
    EXPECT_TRUE(config->validate().has_value());
}

TEST(ConfigTest, ValidateRejectsBadEndpoint) {
    RelayClientConfig config;
    config.server_url = "ws://localhost:9999";
    config.session_endpoint = "";
    EXPECT_EQ(config.validate().error(), ConfigError::INVALID_VALUE);
    config.session_endpoint = "api/sessions";
    EXPECT_EQ(config.validate().error(), ConfigError::INVALID_VALUE);
}

TEST(ConfigTest, LoadFromFile) {
    EXPECT_EQ(RelayClientConfig::load("/nonexistent/relaysync.json").error(), ConfigError::FILE_NOT_FOUND);

    std::string path = ::testing::TempDir() + "relaysync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"server": {"url": "ws://127.0.0.1:7000/ws"}, "reconnect": {"delay_ms": 10}})";
    }
    auto config = RelayClientConfig::load(path);
    std::remove(path.c_str());

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server_url, "ws://127.0.0.1:7000/ws");
    EXPECT_EQ(config->reconnect_delay, std::chrono::milliseconds(10));
}

TEST(ConfigTest, ErrorMessages) {
    EXPECT_EQ(config_error_message(ConfigError::FILE_NOT_FOUND), "Configuration file not found");
    EXPECT_EQ(config_error_message(ConfigError::MISSING_REQUIRED), "Missing required configuration");
}
