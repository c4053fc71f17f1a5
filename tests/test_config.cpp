#include <gtest/gtest.h>
#include "config.h"
#include "fs.h"
#include <string>

using namespace filepunch;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "test_filepunch_settings.json";
        delete_file(path_);
    }

    void TearDown() override {
        delete_file(path_);
    }

    std::string path_;
};

TEST_F(ConfigTest, EmptyObjectKeepsDefaults) {
    ClientSettings settings;
    ASSERT_TRUE(parse_client_settings("{}", settings));
    EXPECT_EQ(settings.server_port, DEFAULT_SERVER_PORT);
    EXPECT_EQ(settings.port_mapping, PortMappingMode::PCP_NATPMP);
    EXPECT_EQ(settings.punch_interval_ms, 250u);
    EXPECT_EQ(settings.punch_deadline_ms, 8000u);
    EXPECT_EQ(settings.local_port, 0);

    ServerConfig config;
    ASSERT_TRUE(parse_server_config("{}", config));
    EXPECT_EQ(config.bind_ip, "0.0.0.0");
    EXPECT_EQ(config.bind_port, DEFAULT_SERVER_PORT);
    EXPECT_EQ(config.selection_policy, "first");
}

TEST_F(ConfigTest, ClientKeysAreRead) {
    const std::string text = R"({
        "server_address": "rendezvous.example.org",
        "server_port": 9000,
        "port_mapping": "forward",
        "external_port": 40000,
        "gateway": "192.168.1.1",
        "local_port": 40000,
        "punch_interval_ms": 100,
        "punch_deadline_ms": 3000,
        "log_level": "DEBUG"
    })";

    ClientSettings settings;
    ASSERT_TRUE(parse_client_settings(text, settings));
    EXPECT_EQ(settings.server_address, "rendezvous.example.org");
    EXPECT_EQ(settings.server_port, 9000);
    EXPECT_EQ(settings.port_mapping, PortMappingMode::FORWARD);
    EXPECT_EQ(settings.external_port, 40000);
    EXPECT_EQ(settings.gateway, "192.168.1.1");
    EXPECT_EQ(settings.local_port, 40000);
    EXPECT_EQ(settings.punch_interval_ms, 100u);
    EXPECT_EQ(settings.punch_deadline_ms, 3000u);
    EXPECT_EQ(settings.log_level, LogLevel::DEBUG);
}

TEST_F(ConfigTest, BadValuesFallBack) {
    ClientSettings settings;
    ASSERT_TRUE(parse_client_settings(R"({"server_port": 70000, "port_mapping": "upnp", "log_level": "loud"})",
                                      settings));
    EXPECT_EQ(settings.server_port, DEFAULT_SERVER_PORT);
    EXPECT_EQ(settings.port_mapping, PortMappingMode::PCP_NATPMP);
    EXPECT_EQ(settings.log_level, LogLevel::INFO);

    ServerConfig config;
    ASSERT_TRUE(parse_server_config(R"({"selection_policy": "round-robin"})", config));
    EXPECT_EQ(config.selection_policy, "first");
}

TEST_F(ConfigTest, InvalidJsonLeavesSettingsUntouched) {
    ClientSettings settings;
    settings.server_address = "keep.me";
    EXPECT_FALSE(parse_client_settings("{ not json", settings));
    EXPECT_EQ(settings.server_address, "keep.me");

    ServerConfig config;
    config.bind_port = 1234;
    EXPECT_FALSE(parse_server_config(R"({"bind_port": "eighty"})", config));
    EXPECT_EQ(config.bind_port, 1234);
}

TEST_F(ConfigTest, SaveAndLoadSettings) {
    ClientSettings settings;
    settings.server_address = "10.1.2.3";
    settings.port_mapping = PortMappingMode::NONE;
    settings.handshake_timeout_ms = 1500;
    settings.log_level = LogLevel::WARN;
    ASSERT_TRUE(save_client_settings(path_, settings));

    ClientSettings loaded;
    ASSERT_TRUE(load_client_settings(path_, loaded));
    EXPECT_EQ(loaded.server_address, "10.1.2.3");
    EXPECT_EQ(loaded.port_mapping, PortMappingMode::NONE);
    EXPECT_EQ(loaded.handshake_timeout_ms, 1500u);
    EXPECT_EQ(loaded.log_level, LogLevel::WARN);
}

TEST_F(ConfigTest, MissingFileIsNotAnError) {
    ServerConfig config;
    config.bind_port = 1;
    EXPECT_TRUE(load_server_config(path_, config));
    EXPECT_EQ(config.bind_port, 1);
}

TEST_F(ConfigTest, NameParsing) {
    PortMappingMode mode = PortMappingMode::NONE;
    EXPECT_TRUE(parse_port_mapping_mode("pcp_natpmp", mode));
    EXPECT_EQ(mode, PortMappingMode::PCP_NATPMP);
    EXPECT_FALSE(parse_port_mapping_mode("PCP", mode));
    EXPECT_STREQ(port_mapping_mode_to_string(PortMappingMode::FORWARD), "forward");

    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("Warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("trace", level));
    EXPECT_EQ(log_level_to_string(LogLevel::ERROR), "error");
}
