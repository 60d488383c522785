#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "description/description_cache.h"
#include "description/i_action_invoker.h"
#include "mocks/mock_upnp_requester.h"

using namespace ssdptrack::ssdp;
using ssdptrack::ssdp::testing::MockRequestAborted;
using ssdptrack::ssdp::testing::MockUpnpRequester;

namespace {

const char* kLocation = "http://192.168.1.1:80/RootDevice.xml";
const char* kDescription =
    "<?xml version=\"1.0\"?><root xmlns=\"urn:schemas-upnp-org:device-1-0\">"
    "<device><UDN>uuid:test</UDN></device></root>";

// Resolves actions against the description the cache holds for the device.
class CachedDescriptionInvoker : public IActionInvoker {
public:
    explicit CachedDescriptionInvoker(DescriptionCache& cache) : cache_(cache) {}

    Arguments call_action(const SsdpDevice& device,
                          const std::string& service_type,
                          const std::string& action_name,
                          const Arguments& args) override {
        auto location = device.location();
        if (!location) {
            throw std::runtime_error("device has no location");
        }
        auto xml = cache_.get_description_xml(*location);
        if (!xml) {
            throw std::runtime_error("description unavailable");
        }
        Arguments out = args;
        out["service"] = service_type;
        out["action"] = action_name;
        out["udn_in_description"] = xml->find(device.udn()) != std::string::npos ? "1" : "0";
        return out;
    }

private:
    DescriptionCache& cache_;
};

} // namespace

class DescriptionCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        requester_ = std::make_shared<MockUpnpRequester>();
        cache_ = std::make_unique<DescriptionCache>(requester_);
    }

    std::shared_ptr<MockUpnpRequester> requester_;
    std::unique_ptr<DescriptionCache> cache_;
};

TEST_F(DescriptionCacheTest, FetchesOnce) {
    requester_->set_response(kLocation, 200, kDescription);

    EXPECT_FALSE(cache_->is_cached(kLocation));
    EXPECT_EQ(cache_->get_description_xml(kLocation).value_or(""), kDescription);
    EXPECT_EQ(cache_->get_description_xml(kLocation).value_or(""), kDescription);

    EXPECT_TRUE(cache_->is_cached(kLocation));
    EXPECT_EQ(requester_->get_request_count(), 1);
    EXPECT_EQ(requester_->get_last_method(), "GET");
    EXPECT_EQ(requester_->get_last_url(), kLocation);
}

TEST_F(DescriptionCacheTest, RetriesOnceOnEmptyBody) {
    requester_->queue_response(kLocation, 200, "");
    requester_->set_response(kLocation, 200, kDescription);

    EXPECT_EQ(cache_->get_description_xml(kLocation).value_or(""), kDescription);
    EXPECT_EQ(requester_->get_request_count(), 2);
}

TEST_F(DescriptionCacheTest, GivesUpAfterSecondEmptyBody) {
    requester_->set_response(kLocation, 200, "");

    EXPECT_FALSE(cache_->get_description_xml(kLocation).has_value());
    EXPECT_EQ(requester_->get_request_count(), 2);
}

TEST_F(DescriptionCacheTest, HttpErrorIsCachedUntilUncached) {
    EXPECT_FALSE(cache_->get_description_xml(kLocation).has_value());
    EXPECT_FALSE(cache_->get_description_xml(kLocation).has_value());
    EXPECT_EQ(requester_->get_request_count(), 1);

    requester_->set_response(kLocation, 200, kDescription);
    cache_->uncache_description(kLocation);
    EXPECT_FALSE(cache_->is_cached(kLocation));
    EXPECT_EQ(cache_->get_description_xml(kLocation).value_or(""), kDescription);
    EXPECT_EQ(requester_->get_request_count(), 2);
}

TEST_F(DescriptionCacheTest, RequesterExceptionYieldsNothing) {
    requester_->set_throw_on_request(true);
    EXPECT_FALSE(cache_->get_description_xml(kLocation).has_value());
    EXPECT_TRUE(cache_->is_cached(kLocation));
}

TEST_F(DescriptionCacheTest, ForeignExceptionReachesCallerAndIsNotCached) {
    requester_->set_abort_on_request(true);
    EXPECT_THROW(cache_->get_description_xml(kLocation), MockRequestAborted);
    EXPECT_FALSE(cache_->is_cached(kLocation));

    requester_->set_abort_on_request(false);
    requester_->set_response(kLocation, 200, kDescription);
    EXPECT_EQ(cache_->get_description_xml(kLocation).value_or(""), kDescription);
    EXPECT_EQ(requester_->get_request_count(), 2);
}

TEST_F(DescriptionCacheTest, MissingRequesterYieldsNothing) {
    DescriptionCache cache(nullptr);
    EXPECT_FALSE(cache.get_description_xml(kLocation).has_value());
}

TEST_F(DescriptionCacheTest, ConcurrentCallersShareOneFetch) {
    requester_->set_response(kLocation, 200, kDescription);

    std::vector<std::future<std::optional<std::string>>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(std::async(std::launch::async, [this]() { return cache_->get_description_xml(kLocation); }));
    }
    for (auto& result : results) {
        EXPECT_EQ(result.get().value_or(""), kDescription);
    }
    EXPECT_EQ(requester_->get_request_count(), 1);
}

TEST_F(DescriptionCacheTest, ActionInvokerUsesCachedDescription) {
    requester_->set_response(kLocation, 200, kDescription);
    SsdpDevice device("uuid:test", std::chrono::system_clock::now() + std::chrono::seconds(1800));
    device.add_location(kLocation, device.valid_to());

    CachedDescriptionInvoker invoker(*cache_);
    auto out = invoker.call_action(device, "urn:schemas-upnp-org:service:WANIPConnection:1",
                                   "GetExternalIPAddress", {{"NewTimeout", "5"}});
    EXPECT_EQ(out["action"], "GetExternalIPAddress");
    EXPECT_EQ(out["udn_in_description"], "1");
    EXPECT_EQ(out["NewTimeout"], "5");

    invoker.call_action(device, "urn:schemas-upnp-org:service:WANIPConnection:1", "GetStatusInfo", {});
    EXPECT_EQ(requester_->get_request_count(), 1);

    SsdpDevice nowhere("uuid:nowhere", device.valid_to());
    EXPECT_THROW(invoker.call_action(nowhere, "x", "y", {}), std::runtime_error);
}
