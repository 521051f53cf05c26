#include <gtest/gtest.h>

#include <lanwatch/arp.hpp>
#include <lanwatch/prober.hpp>

static const MAC OWN_MAC{0x02, 0x00, 0x5e, 0x10, 0x20, 0x30};

static ArpFrame reply(const MAC& sender_mac, const IPv4& sender_ip) {
    // a request from the responder with the opcode flipped has the same layout
    auto frame = make_arp_request(sender_mac, sender_ip, IPv4{10, 0, 0, 5});
    frame[21] = static_cast<uint8_t>(ARP_OP_REPLY);
    return frame;
}

TEST(ReplyTableTest, CollectsRepliesBySenderAddress) {
    ReplyTable table{OWN_MAC};
    auto a = reply(MAC{0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff}, IPv4{10, 0, 0, 1});
    auto b = reply(MAC{0x11, 0x22, 0x33, 0x44, 0x55, 0x66}, IPv4{10, 0, 0, 2});
    EXPECT_TRUE(table.add_frame(b.data(), b.size()));
    EXPECT_TRUE(table.add_frame(a.data(), a.size()));

    auto hosts = table.hosts();
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(to_string(hosts[0].addr), "10.0.0.1");
    EXPECT_EQ(to_string(hosts[0].mac), "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(to_string(hosts[1].addr), "10.0.0.2");
    EXPECT_FALSE(hosts[0].name.has_value());
}

TEST(ReplyTableTest, DuplicateRepliesCollapseLastWins) {
    ReplyTable table{OWN_MAC};
    auto first = reply(MAC{0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff}, IPv4{10, 0, 0, 1});
    auto again = reply(MAC{0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff}, IPv4{10, 0, 0, 1});
    auto moved = reply(MAC{0x11, 0x22, 0x33, 0x44, 0x55, 0x66}, IPv4{10, 0, 0, 1});
    table.add_frame(first.data(), first.size());
    table.add_frame(again.data(), again.size());
    table.add_frame(moved.data(), moved.size());

    auto hosts = table.hosts();
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(to_string(hosts[0].mac), "11:22:33:44:55:66");
}

TEST(ReplyTableTest, UnsolicitedRepliesOutsideTheRangeAreKept) {
    ReplyTable table{OWN_MAC};
    auto stray = reply(MAC{0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0x01}, IPv4{192, 168, 50, 9});
    EXPECT_TRUE(table.add_frame(stray.data(), stray.size()));
    EXPECT_EQ(table.size(), 1u);
}

TEST(ReplyTableTest, IgnoresRequestsAndOwnFrames) {
    ReplyTable table{OWN_MAC};
    auto request = make_arp_request(MAC{0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff}, IPv4{10, 0, 0, 1}, IPv4{10, 0, 0, 9});
    auto own = reply(OWN_MAC, IPv4{10, 0, 0, 5});
    EXPECT_FALSE(table.add_frame(request.data(), request.size()));
    EXPECT_FALSE(table.add_frame(own.data(), own.size()));
    EXPECT_EQ(table.size(), 0u);
}
