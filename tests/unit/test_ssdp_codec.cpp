#include <gtest/gtest.h>
#include <string>
#include "protocol/ssdp_codec.h"
#include "ssdp_errors.h"

using namespace ssdptrack::ssdp;

namespace {

const char* kSearchResponse =
    "HTTP/1.1 200 OK\r\n"
    "Cache-Control: max-age=1800\r\n"
    "ST: urn:schemas-upnp-org:service:WANCommonInterfaceConfig:1\r\n"
    "USN: uuid:test_udn::urn:schemas-upnp-org:service:WANCommonInterfaceConfig:1\r\n"
    "Location: http://192.168.1.1:80/RootDevice.xml\r\n"
    "EXT:\r\n"
    "\r\n";

AddressTuple local_v4() { return make_ipv4_address("192.168.1.10", 1900); }
AddressTuple remote_v4() { return make_ipv4_address("192.168.1.1", 1900); }

} // namespace

TEST(SsdpCodecTest, EncodeJoinsLinesWithCrlf) {
    SsdpHeaders headers{{"NT", "upnp:rootdevice"}, {"NTS", "ssdp:alive"}, {"_udn", "uuid:hidden"}};
    const std::string packet = encode_ssdp_packet(kNotifyRequestLine, headers);
    EXPECT_EQ(packet, "NOTIFY * HTTP/1.1\r\nNT:upnp:rootdevice\r\nNTS:ssdp:alive\r\n\r\n");
}

TEST(SsdpCodecTest, BuildSearchPacketForIpv4) {
    const std::string packet = build_ssdp_search_packet(ssdp_target_v4(), 4, "ssdp:all");
    EXPECT_EQ(packet,
              "M-SEARCH * HTTP/1.1\r\n"
              "HOST:239.255.255.250:1900\r\n"
              "MAN:\"ssdp:discover\"\r\n"
              "MX:4\r\n"
              "ST:ssdp:all\r\n"
              "\r\n");
}

TEST(SsdpCodecTest, BuildSearchPacketBracketsIpv6Host) {
    const std::string packet = build_ssdp_search_packet(ssdp_target_v6(3), 2, "upnp:rootdevice");
    EXPECT_NE(packet.find("HOST:[ff02::c]:1900\r\n"), std::string::npos);
}

TEST(SsdpCodecTest, ValidPacketShapes) {
    EXPECT_TRUE(is_valid_ssdp_packet("NOTIFY * HTTP/1.1\r\n\r\n"));
    EXPECT_TRUE(is_valid_ssdp_packet("M-SEARCH * HTTP/1.1\r\n\r\n"));
    EXPECT_TRUE(is_valid_ssdp_packet(kSearchResponse));

    EXPECT_FALSE(is_valid_ssdp_packet(""));
    EXPECT_FALSE(is_valid_ssdp_packet("NOTIFY * HTTP/1.1"));  // No newline
    EXPECT_FALSE(is_valid_ssdp_packet("HTTP/1.1 404 Not Found\r\n\r\n"));
    EXPECT_FALSE(is_valid_ssdp_packet("GET / HTTP/1.1\r\n\r\n"));
    EXPECT_FALSE(is_valid_ssdp_packet(std::string("\x01\x02\n", 3)));
}

TEST(SsdpCodecTest, DecodeSearchResponse) {
    auto decoded = decode_ssdp_packet(kSearchResponse, local_v4(), remote_v4());
    const SsdpHeaders& headers = decoded.second;

    EXPECT_EQ(decoded.first, "HTTP/1.1 200 OK");
    EXPECT_EQ(headers.get_or("st", ""), "urn:schemas-upnp-org:service:WANCommonInterfaceConfig:1");
    EXPECT_EQ(headers.get_or("LOCATION", ""), "http://192.168.1.1:80/RootDevice.xml");
    EXPECT_EQ(headers.get_or("ext", "missing"), "");
    EXPECT_EQ(headers.get_or("_udn", ""), "uuid:test_udn");
    EXPECT_EQ(headers.get_or("_host", ""), "192.168.1.1");
    EXPECT_EQ(headers.get_or("_port", ""), "1900");
    EXPECT_EQ(headers.get_or("_local_addr", ""), "192.168.1.10:1900");
    EXPECT_EQ(headers.get_or("_remote_addr", ""), "192.168.1.1:1900");
    EXPECT_EQ(headers.get_or("_location_original", ""), "http://192.168.1.1:80/RootDevice.xml");
    EXPECT_TRUE(get_timestamp(headers).has_value());
}

TEST(SsdpCodecTest, DecodeAcceptsBareLineFeeds) {
    auto decoded = decode_ssdp_packet("NOTIFY * HTTP/1.1\nNT: upnp:rootdevice\nNTS: ssdp:byebye\n\n",
                                      local_v4(), remote_v4());
    EXPECT_EQ(decoded.first, "NOTIFY * HTTP/1.1");
    EXPECT_EQ(decoded.second.get_or("nts", ""), "ssdp:byebye");
}

TEST(SsdpCodecTest, DecodeToleratesMissingBlankTerminator) {
    auto decoded = decode_ssdp_packet("NOTIFY * HTTP/1.1\r\nNT: upnp:rootdevice\r\nNTS: ssdp:alive",
                                      local_v4(), remote_v4());
    EXPECT_EQ(decoded.second.get_or("nts", ""), "ssdp:alive");
}

TEST(SsdpCodecTest, DecodeStopsAtBlankLine) {
    auto decoded = decode_ssdp_packet("NOTIFY * HTTP/1.1\r\nNT: a\r\n\r\nthis is a body\r\n",
                                      local_v4(), remote_v4());
    EXPECT_EQ(decoded.second.get_or("nt", ""), "a");
    EXPECT_FALSE(decoded.second.contains("this is a body"));
}

TEST(SsdpCodecTest, DecodeFoldsContinuationLines) {
    auto decoded = decode_ssdp_packet("NOTIFY * HTTP/1.1\r\nSERVER: Linux/5.0\r\n  UPnP/1.0\r\n\r\n",
                                      local_v4(), remote_v4());
    EXPECT_EQ(decoded.second.get_or("server", ""), "Linux/5.0 UPnP/1.0");
}

TEST(SsdpCodecTest, DecodeRejectsLineWithoutColon) {
    EXPECT_THROW(decode_ssdp_packet("NOTIFY * HTTP/1.1\r\nthis is not a header\r\n\r\n", local_v4(), remote_v4()),
                 SsdpDecodeError);
    EXPECT_THROW(decode_ssdp_packet("NOTIFY * HTTP/1.1\r\n: no name\r\n\r\n", local_v4(), remote_v4()),
                 SsdpDecodeError);
}

TEST(SsdpCodecTest, DecodeWithoutUuidUsnHasNoUdn) {
    auto decoded = decode_ssdp_packet("NOTIFY * HTTP/1.1\r\nUSN: some-printer-chatter\r\n\r\n",
                                      local_v4(), remote_v4());
    EXPECT_FALSE(decoded.second.contains("_udn"));
}

TEST(SsdpCodecTest, DecodeAdjustsLinkLocalLocationForScopedSender) {
    const AddressTuple remote = make_ipv6_address("fe80::1", 1900, 4);
    const AddressTuple local = make_ipv6_address("fe80::2", 1900, 4);
    auto decoded = decode_ssdp_packet("NOTIFY * HTTP/1.1\r\nLOCATION: http://[fe80::1]:8080/desc.xml\r\n\r\n",
                                      local, remote);

    EXPECT_EQ(decoded.second.get_or("location", ""), "http://[fe80::1%4]:8080/desc.xml");
    EXPECT_EQ(decoded.second.get_or("_location_original", ""), "http://[fe80::1]:8080/desc.xml");
    EXPECT_EQ(decoded.second.get_or("_host", ""), "fe80::1%4");
}

TEST(SsdpCodecTest, HeaderRoundTripModuloSyntheticFields) {
    SsdpHeaders original{
        {"CACHE-CONTROL", "max-age=1800"},
        {"NT", "upnp:rootdevice"},
        {"NTS", "ssdp:alive"},
        {"USN", "uuid:abc-123::upnp:rootdevice"},
        {"LOCATION", "http://192.168.1.1:80/RootDevice.xml"},
    };
    auto decoded = decode_ssdp_packet(encode_ssdp_packet(kNotifyRequestLine, original), local_v4(), remote_v4());

    SsdpHeaders wire_only;
    for (const auto& entry : decoded.second) {
        if (!is_internal_header(entry.first)) {
            wire_only.set(entry.first, entry.second);
        }
    }
    EXPECT_EQ(decoded.first, kNotifyRequestLine);
    EXPECT_EQ(wire_only, original);
}

TEST(SsdpCodecTest, UdnFromUsn) {
    EXPECT_EQ(udn_from_usn("uuid:abc-123::urn:schemas-upnp-org:service:Foo:1"), std::string("uuid:abc-123"));
    EXPECT_EQ(udn_from_usn("uuid:abc-123"), std::string("uuid:abc-123"));
    EXPECT_FALSE(udn_from_usn("garbage-no-uuid-prefix").has_value());
    EXPECT_FALSE(udn_from_usn("").has_value());
}

TEST(SsdpCodecTest, UdnFromHeaders) {
    SsdpHeaders headers{{"Usn", "uuid:dev::upnp:rootdevice"}};
    EXPECT_EQ(udn_from_headers(headers), std::string("uuid:dev"));
    EXPECT_FALSE(udn_from_headers(SsdpHeaders()).has_value());
}
