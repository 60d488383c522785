/**
 * @file test_udp_transport.cpp
 * @brief Exercises the UDP transport against raw sockets on the loopback interface.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "net/event_loop.h"
#include "net/socket_platform.h"
#include "protocol/ssdp_codec.h"
#include "ssdp_errors.h"
#include "transport/udp_ssdp_transport.h"
#include "loopback_peer.h"

using namespace ssdptrack::ssdp;
using ssdptrack::ssdp::testing::RawPeer;
using namespace std::chrono_literals;

namespace {

constexpr auto WAIT_TIMEOUT = 2s;

const char* kResponse =
    "HTTP/1.1 200 OK\r\n"
    "CACHE-CONTROL: max-age=1800\r\n"
    "EXT:\r\n"
    "LOCATION: http://192.168.1.1:80/RootDevice.xml\r\n"
    "SERVER: Linux/5.0 UPnP/1.0 Router/1.0\r\n"
    "ST: upnp:rootdevice\r\n"
    "USN: uuid:loopback::upnp:rootdevice\r\n"
    "\r\n";

}  // namespace

class UdpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        loop_ = std::make_unique<EventLoop>("[UdpTransportTest]", 50);
        loop_->start();
        peer_ = std::make_unique<RawPeer>();
        ASSERT_TRUE(peer_->ok());
    }

    void TearDown() override {
        if (transport_) {
            transport_->close();
        }
        loop_->stop();
    }

    TransportSpec search_spec() const {
        TransportSpec spec;
        spec.source = make_ipv4_address("127.0.0.1", 0);
        spec.target = peer_->address();
        spec.role = TransportRole::SEARCH;
        return spec;
    }

    TransportCallbacks recording_callbacks() {
        TransportCallbacks callbacks;
        callbacks.on_connect = [this](ISsdpTransport&) { connected_.set_value(); };
        callbacks.on_data = [this](const std::string& request_line, const SsdpHeaders& headers) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.emplace_back(request_line, headers);
            if (received_.size() == expected_) {
                all_received_.set_value();
            }
        };
        return callbacks;
    }

    std::vector<std::pair<std::string, SsdpHeaders>> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::unique_ptr<EventLoop> loop_;
    std::unique_ptr<RawPeer> peer_;
    std::unique_ptr<UdpSsdpTransport> transport_;

    std::promise<void> connected_;
    std::promise<void> all_received_;
    size_t expected_ = 1;
    std::mutex mutex_;
    std::vector<std::pair<std::string, SsdpHeaders>> received_;
};

TEST_F(UdpTransportTest, SearchRoundTripOverLoopback) {
    transport_ = std::make_unique<UdpSsdpTransport>(search_spec(), *loop_, recording_callbacks());
    transport_->open();
    EXPECT_FALSE(transport_->is_closed());
    EXPECT_EQ(transport_->local_address().host, "127.0.0.1");
    EXPECT_NE(transport_->local_address().port, 0);
    ASSERT_EQ(connected_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);

    transport_->send(build_ssdp_search_packet(ssdp_target_v4(), 1, "ssdp:all"), peer_->address());
    AddressTuple from;
    const std::string request = peer_->receive(&from);
    ASSERT_FALSE(request.empty());
    EXPECT_EQ(request.rfind(kSearchRequestLine, 0), 0u);
    EXPECT_EQ(from.port, transport_->local_address().port);

    auto done = all_received_.get_future();
    peer_->send_to(from, kResponse);
    ASSERT_EQ(done.wait_for(WAIT_TIMEOUT), std::future_status::ready);

    auto packets = received();
    ASSERT_EQ(packets.size(), 1u);
    EXPECT_EQ(packets[0].first, kOkStatusLine);
    EXPECT_EQ(packets[0].second.get_or("_udn", ""), "uuid:loopback");
    EXPECT_EQ(packets[0].second.get_or("_host", ""), "127.0.0.1");
    EXPECT_EQ(packets[0].second.get_or("_port", ""), std::to_string(peer_->address().port));
}

TEST_F(UdpTransportTest, InvalidDatagramsAreDropped) {
    transport_ = std::make_unique<UdpSsdpTransport>(search_spec(), *loop_, recording_callbacks());
    transport_->open();
    auto done = all_received_.get_future();
    const AddressTuple local = make_ipv4_address("127.0.0.1", transport_->local_address().port);

    peer_->send_to(local, "not ssdp at all");
    peer_->send_to(local, "HTTP/1.1 200 OK\r\nthis line has no separator\r\n\r\n");
    peer_->send_to(local, kResponse);

    ASSERT_EQ(done.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(received().size(), 1u);
}

TEST_F(UdpTransportTest, AdvertisementRoleBindsTargetPort) {
    // Reserve a free port, then let the transport take it over.
    uint16_t port = 0;
    {
        RawPeer reserve;
        ASSERT_TRUE(reserve.ok());
        port = reserve.address().port;
    }

    TransportSpec spec;
    spec.source = make_ipv4_address("127.0.0.1", 0);
    spec.target = make_ipv4_address("127.0.0.1", port);
    spec.role = TransportRole::ADVERTISEMENT;
    transport_ = std::make_unique<UdpSsdpTransport>(spec, *loop_, recording_callbacks());
    transport_->open();
    EXPECT_EQ(transport_->local_address().port, port);

    auto done = all_received_.get_future();
    peer_->send_to(spec.target,
                   "NOTIFY * HTTP/1.1\r\n"
                   "HOST: 239.255.255.250:1900\r\n"
                   "CACHE-CONTROL: max-age=1800\r\n"
                   "LOCATION: http://192.168.1.1:80/RootDevice.xml\r\n"
                   "NT: upnp:rootdevice\r\n"
                   "NTS: ssdp:alive\r\n"
                   "USN: uuid:loopback::upnp:rootdevice\r\n"
                   "\r\n");
    ASSERT_EQ(done.wait_for(WAIT_TIMEOUT), std::future_status::ready);
    EXPECT_EQ(received()[0].second.get_or("NTS", ""), "ssdp:alive");
}

TEST_F(UdpTransportTest, CloseStopsDeliveryAndSending) {
    transport_ = std::make_unique<UdpSsdpTransport>(search_spec(), *loop_, recording_callbacks());
    transport_->open();
    const AddressTuple local = make_ipv4_address("127.0.0.1", transport_->local_address().port);

    transport_->close();
    transport_->close();
    EXPECT_TRUE(transport_->is_closed());

    transport_->send("M-SEARCH * HTTP/1.1\r\n\r\n", peer_->address());
    peer_->send_to(local, kResponse);
    std::this_thread::sleep_for(100ms);
    loop_->run_sync([]() {});
    EXPECT_TRUE(received().empty());
}

TEST_F(UdpTransportTest, BindFailureThrows) {
    TransportSpec spec = search_spec();
    // TEST-NET-1 is never assigned to a local interface.
    spec.source = make_ipv4_address("192.0.2.1", 0);
    EXPECT_THROW(udp_transport_factory()(spec, *loop_, TransportCallbacks()), SsdpSocketError);
}

TEST_F(UdpTransportTest, FactoryOpensTransport) {
    auto transport = udp_transport_factory()(search_spec(), *loop_, recording_callbacks());
    ASSERT_NE(transport, nullptr);
    EXPECT_FALSE(transport->is_closed());
    EXPECT_EQ(connected_.get_future().wait_for(WAIT_TIMEOUT), std::future_status::ready);
    transport->close();
}

TEST(SelectBindAddressTest, SearchBindsSource) {
    const AddressTuple source = make_ipv4_address("192.168.1.10", 0);
    EXPECT_EQ(select_bind_address(TransportRole::SEARCH, source, ssdp_target_v4()), source);
}

TEST(SelectBindAddressTest, AdvertisementBindsForSsdpPort) {
    const AddressTuple source = make_ipv4_address("192.168.1.10", 0);
    const AddressTuple bound = select_bind_address(TransportRole::ADVERTISEMENT, source, ssdp_target_v4());
    EXPECT_EQ(bound.port, kSsdpPort);
#ifdef _WIN32
    EXPECT_EQ(bound.host, source.host);
#else
    EXPECT_EQ(bound.host, ssdp_target_v4().host);
#endif
}
