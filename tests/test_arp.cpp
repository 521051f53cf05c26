#include <gtest/gtest.h>

#include <lanwatch/arp.hpp>

#include <vector>

static const MAC SRC_MAC{0x02, 0x00, 0x5e, 0x10, 0x20, 0x30};
static const IPv4 SRC_IP{10, 0, 0, 5};

TEST(ArpTest, RequestIsBroadcastWhoHas) {
    auto frame = make_arp_request(SRC_MAC, SRC_IP, IPv4{10, 0, 0, 1});

    for (size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(frame[i], 0xff);
        EXPECT_EQ(frame[6 + i], SRC_MAC[i]);
    }
    EXPECT_EQ(frame[12], 0x08);
    EXPECT_EQ(frame[13], 0x06);

    auto arp = parse_arp(frame.data(), frame.size());
    ASSERT_TRUE(arp.has_value());
    EXPECT_EQ(arp->op, ARP_OP_REQUEST);
    EXPECT_EQ(arp->sender_mac, SRC_MAC);
    EXPECT_EQ(arp->sender_ip, SRC_IP);
    EXPECT_EQ(arp->target_mac, (MAC{}));
    EXPECT_EQ(arp->target_ip, (IPv4{10, 0, 0, 1}));
}

TEST(ArpTest, ParsesPaddedReply) {
    // replies on the wire are padded to the 60 byte ethernet minimum
    std::vector<uint8_t> frame{
        0x02, 0x00, 0x5e, 0x10, 0x20, 0x30,
        0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff,
        0x08, 0x06,
        0x00, 0x01, 0x08, 0x00, 0x06, 0x04, 0x00, 0x02,
        0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff, 10, 0, 0, 1,
        0x02, 0x00, 0x5e, 0x10, 0x20, 0x30, 10, 0, 0, 5
    };
    frame.resize(60, 0);

    auto arp = parse_arp(frame.data(), frame.size());
    ASSERT_TRUE(arp.has_value());
    EXPECT_EQ(arp->op, ARP_OP_REPLY);
    EXPECT_EQ(to_string(arp->sender_mac), "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(to_string(arp->sender_ip), "10.0.0.1");
    EXPECT_EQ(arp->target_ip, SRC_IP);
}

TEST(ArpTest, RejectsOtherFrames) {
    auto frame = make_arp_request(SRC_MAC, SRC_IP, IPv4{10, 0, 0, 1});
    EXPECT_FALSE(parse_arp(frame.data(), frame.size() - 1).has_value());
    EXPECT_FALSE(parse_arp(nullptr, 0).has_value());

    auto ipv4 = frame;
    ipv4[13] = 0x00;
    EXPECT_FALSE(parse_arp(ipv4.data(), ipv4.size()).has_value());

    auto ipv6_payload = frame;
    ipv6_payload[16] = 0x86;
    ipv6_payload[17] = 0xdd;
    EXPECT_FALSE(parse_arp(ipv6_payload.data(), ipv6_payload.size()).has_value());
}
