#include <gtest/gtest.h>
#include <chrono>
#include "tracker/ssdp_device.h"
#include "ssdp_types.h"

using namespace ssdptrack::ssdp;

class SsdpDeviceTest : public ::testing::Test {
protected:
    TimePoint t0_ = TimePoint(std::chrono::seconds(1000));
    SsdpDevice device_{"uuid:device", t0_ + std::chrono::seconds(100)};
};

TEST_F(SsdpDeviceTest, StartsWithoutLocation) {
    EXPECT_EQ(device_.udn(), "uuid:device");
    EXPECT_FALSE(device_.location().has_value());
    EXPECT_TRUE(device_.locations().empty());
    EXPECT_FALSE(device_.last_seen().has_value());
}

TEST_F(SsdpDeviceTest, MostRecentLocationFirst) {
    device_.add_location("http://10.0.0.1/a.xml", t0_ + std::chrono::seconds(10));
    device_.add_location("http://10.0.0.2/a.xml", t0_ + std::chrono::seconds(20));
    EXPECT_EQ(device_.location().value_or(""), "http://10.0.0.2/a.xml");

    // Re-adding moves to the front and refreshes the expiry without duplicating.
    device_.add_location("http://10.0.0.1/a.xml", t0_ + std::chrono::seconds(30));
    ASSERT_EQ(device_.locations().size(), 2u);
    EXPECT_EQ(device_.locations()[0].url, "http://10.0.0.1/a.xml");
    EXPECT_EQ(device_.locations()[0].valid_to, t0_ + std::chrono::seconds(30));
    EXPECT_TRUE(device_.has_location("http://10.0.0.2/a.xml"));
    EXPECT_FALSE(device_.has_location("http://10.0.0.3/a.xml"));
}

TEST_F(SsdpDeviceTest, PurgeLocationsDropsExpired) {
    device_.add_location("http://10.0.0.1/a.xml", t0_ + std::chrono::seconds(10));
    device_.add_location("http://10.0.0.2/a.xml", t0_ + std::chrono::seconds(20));

    device_.purge_locations(t0_ + std::chrono::seconds(10));
    EXPECT_EQ(device_.locations().size(), 2u);

    device_.purge_locations(t0_ + std::chrono::seconds(15));
    ASSERT_EQ(device_.locations().size(), 1u);
    EXPECT_EQ(device_.location().value_or(""), "http://10.0.0.2/a.xml");

    device_.purge_locations(t0_ + std::chrono::seconds(25));
    EXPECT_FALSE(device_.location().has_value());
}

TEST_F(SsdpDeviceTest, CombinedHeadersPreferAdvertisement) {
    SsdpHeaders search{{"ST", "upnp:rootdevice"}, {"SERVER", "old"}, {"X-SEARCH", "1"}};
    set_source(search, SsdpSource::SEARCH);
    SsdpHeaders advertisement{{"NT", "upnp:rootdevice"}, {"Server", "new"}};
    set_source(advertisement, SsdpSource::ADVERTISEMENT);

    device_.search_headers()["upnp:rootdevice"] = search;
    device_.advertisement_headers()["upnp:rootdevice"] = advertisement;

    SsdpHeaders combined = device_.combined_headers("upnp:rootdevice");
    EXPECT_EQ(combined.get_or("server", ""), "new");
    EXPECT_EQ(combined.get_or("x-search", ""), "1");
    EXPECT_EQ(combined.get_or("nt", ""), "upnp:rootdevice");
    EXPECT_FALSE(combined.contains("_source"));

    EXPECT_TRUE(device_.combined_headers("urn:unknown").empty());
}

TEST_F(SsdpDeviceTest, AllCombinedHeadersCoversBothChannels) {
    device_.search_headers()["urn:a"] = SsdpHeaders{{"ST", "urn:a"}};
    device_.advertisement_headers()["urn:b"] = SsdpHeaders{{"NT", "urn:b"}};
    device_.advertisement_headers()["urn:a"] = SsdpHeaders{{"NT", "urn:a"}};

    auto all = device_.all_combined_headers();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all["urn:a"].size(), 2u);
    EXPECT_EQ(all["urn:b"].get_or("nt", ""), "urn:b");
}
