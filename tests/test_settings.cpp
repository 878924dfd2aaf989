#include "settings.hpp"

#include <gtest/gtest.h>

TEST(SettingsTest, EmptyObjectGivesDefaults) {
    LanQueueSettings settings = parseSettings("{}");

    EXPECT_EQ(settings.role, Role::Off);
    EXPECT_EQ(settings.host, "");
    EXPECT_EQ(settings.port, 21991);
    EXPECT_EQ(settings.password, "");
    EXPECT_EQ(settings.queueName, "LAN Queue");
    EXPECT_EQ(settings.memberName, "");
    EXPECT_EQ(settings.connectTimeoutMs, 3000);
}

TEST(SettingsTest, ReadsApplicationKeys) {
    LanQueueSettings settings = parseSettings(R"({
        "max_history_items": 200,
        "lan_queue_role": "client",
        "lan_queue_host": "192.168.1.5",
        "lan_queue_port": 9001,
        "lan_queue_password": "secret",
        "lan_queue_member_name": "Laptop",
        "handshake_timeout_ms": 500
    })");

    EXPECT_EQ(settings.role, Role::Client);
    EXPECT_EQ(settings.host, "192.168.1.5");
    EXPECT_EQ(settings.port, 9001);
    EXPECT_EQ(settings.password, "secret");
    EXPECT_EQ(settings.memberName, "Laptop");

    LanQueueConfig config = toConfig(settings);
    EXPECT_EQ(config.handshakeTimeout.count(), 500);
    EXPECT_EQ(config.connectTimeout.count(), 3000);
}

TEST(SettingsTest, RejectsBadValues) {
    EXPECT_THROW(parseSettings("{\"lan_queue_role\":\"server\"}"), SettingsError);
    EXPECT_THROW(parseSettings("{\"lan_queue_port\":70000}"), SettingsError);
    EXPECT_THROW(parseSettings("{\"lan_queue_port\":\"9001\"}"), SettingsError);
    EXPECT_THROW(parseSettings("{\"log_level\":\"loud\"}"), SettingsError);
    EXPECT_THROW(parseSettings("{\"connect_timeout_ms\":0}"), SettingsError);
    EXPECT_THROW(parseSettings("not json"), SettingsError);
    EXPECT_THROW(parseSettings("[]"), SettingsError);
}

TEST(SettingsTest, MissingFileIsReported) {
    EXPECT_THROW(loadSettings("/nonexistent/lanqueue/settings.json"), SettingsError);
}
