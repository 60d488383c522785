#include <gtest/gtest.h>
#include "configuration/ssdp_engine_settings.h"

using namespace ssdptrack::ssdp;

TEST(EngineSettingsTest, Defaults) {
    SsdpEngineSettings settings;
    EXPECT_EQ(settings.search_mx, 4);
    EXPECT_EQ(settings.search_target, "ssdp:all");
    EXPECT_EQ(settings.multicast_ttl, 2);
    EXPECT_EQ(settings.default_max_age_seconds, 900);
    EXPECT_EQ(settings.receive_buffer_size, 8192u);
    EXPECT_EQ(settings.loop_poll_timeout_ms, 1000);
}

TEST(EngineSettingsTest, SanitizeReplacesInvalidValues) {
    SsdpEngineSettings settings;
    settings.search_mx = -1;
    settings.search_target = "";
    settings.multicast_ttl = 300;
    settings.default_max_age_seconds = 0;
    settings.receive_buffer_size = 512;
    settings.loop_poll_timeout_ms = 0;

    SsdpEngineSettings sanitized = sanitize_settings(settings);
    EXPECT_EQ(sanitized.search_mx, kDefaultSearchMx);
    EXPECT_EQ(sanitized.search_target, kDefaultSearchTarget);
    EXPECT_EQ(sanitized.multicast_ttl, kDefaultMulticastTtl);
    EXPECT_EQ(sanitized.default_max_age_seconds, kDefaultMaxAgeSeconds);
    EXPECT_EQ(sanitized.receive_buffer_size, kDefaultReceiveBufferSize);
    EXPECT_EQ(sanitized.loop_poll_timeout_ms, kDefaultLoopPollTimeoutMs);
}

TEST(EngineSettingsTest, SanitizeKeepsValidValues) {
    SsdpEngineSettings settings;
    settings.search_mx = 1;
    settings.search_target = "upnp:rootdevice";
    settings.multicast_ttl = 255;
    settings.default_max_age_seconds = 1800;
    settings.receive_buffer_size = 65536;
    settings.loop_poll_timeout_ms = 50;

    SsdpEngineSettings sanitized = sanitize_settings(settings);
    EXPECT_EQ(sanitized.search_mx, 1);
    EXPECT_EQ(sanitized.search_target, "upnp:rootdevice");
    EXPECT_EQ(sanitized.multicast_ttl, 255);
    EXPECT_EQ(sanitized.default_max_age_seconds, 1800);
    EXPECT_EQ(sanitized.receive_buffer_size, 65536u);
    EXPECT_EQ(sanitized.loop_poll_timeout_ms, 50);
}
