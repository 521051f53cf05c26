#include <gtest/gtest.h>

#include <lanwatch/net.hpp>

TEST(Ipv4Test, ParsesDottedQuad) {
    auto addr = parse_ipv4("192.168.1.42");
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(*addr, (IPv4{192, 168, 1, 42}));
    EXPECT_EQ(to_string(*addr), "192.168.1.42");
}

TEST(Ipv4Test, RejectsMalformedAddresses) {
    EXPECT_FALSE(parse_ipv4("").has_value());
    EXPECT_FALSE(parse_ipv4("192.168.1").has_value());
    EXPECT_FALSE(parse_ipv4("192.168.1.42.7").has_value());
    EXPECT_FALSE(parse_ipv4("256.1.1.1").has_value());
    EXPECT_FALSE(parse_ipv4("1.2.3.1000").has_value());
    EXPECT_FALSE(parse_ipv4("a.b.c.d").has_value());
    EXPECT_FALSE(parse_ipv4("1..2.3").has_value());
    EXPECT_FALSE(parse_ipv4(" 1.2.3.4").has_value());
}

TEST(Ipv4Test, ClassifiesReservedBlocks) {
    EXPECT_TRUE(is_link_local(IPv4{169, 254, 1, 5}));
    EXPECT_FALSE(is_link_local(IPv4{169, 253, 1, 5}));
    EXPECT_TRUE(is_loopback(IPv4{127, 0, 0, 1}));
    EXPECT_FALSE(is_loopback(IPv4{10, 0, 0, 1}));
}

TEST(MacTest, ParsesBothSeparators) {
    auto colon = parse_mac("aa:bb:cc:dd:ee:ff");
    auto dash = parse_mac("AA-BB-CC-DD-EE-FF");
    ASSERT_TRUE(colon.has_value());
    ASSERT_TRUE(dash.has_value());
    EXPECT_EQ(*colon, *dash);
    EXPECT_EQ(to_string(*colon), "aa:bb:cc:dd:ee:ff");
    EXPECT_FALSE(parse_mac("aa:bb:cc:dd:ee").has_value());
    EXPECT_FALSE(parse_mac("aa:bb:cc:dd:ee:gg").has_value());
}

TEST(MaskTest, PrefixLengthRoundTrip) {
    EXPECT_EQ(prefix_len_from_mask(IPv4{255, 255, 255, 0}), 24);
    EXPECT_EQ(prefix_len_from_mask(IPv4{255, 255, 252, 0}), 22);
    EXPECT_EQ(prefix_len_from_mask(IPv4{0, 0, 0, 0}), 0);
    EXPECT_EQ(prefix_len_from_mask(IPv4{255, 255, 255, 255}), 32);
    EXPECT_FALSE(prefix_len_from_mask(IPv4{255, 0, 255, 0}).has_value());
    EXPECT_EQ(mask_from_prefix_len(20), (IPv4{255, 255, 240, 0}));
}

TEST(NetworkRangeTest, MasksHostAddress) {
    auto range = NetworkRange::from_mask(IPv4{192, 168, 1, 42}, IPv4{255, 255, 255, 0});
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->base(), (IPv4{192, 168, 1, 0}));
    EXPECT_EQ(range->prefix_len(), 24);
    EXPECT_EQ(range->to_string(), "192.168.1.0/24");
    EXPECT_EQ(range->broadcast(), (IPv4{192, 168, 1, 255}));
}

TEST(NetworkRangeTest, ParsesCidr) {
    auto range = NetworkRange::parse("10.0.0.0/8");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->prefix_len(), 8);
    EXPECT_FALSE(NetworkRange::parse("10.0.0.1/8").has_value());
    EXPECT_FALSE(NetworkRange::parse("10.0.0.0/33").has_value());
    EXPECT_FALSE(NetworkRange::parse("10.0.0.0").has_value());
    EXPECT_FALSE(NetworkRange::parse("10.0.0.0/").has_value());
}

TEST(NetworkRangeTest, HostsExcludeNetworkAndBroadcast) {
    NetworkRange range{IPv4{192, 168, 1, 0}, 24};
    auto hosts = range.hosts();
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(range.host_count(), 254u);
    EXPECT_EQ(hosts.front(), (IPv4{192, 168, 1, 1}));
    EXPECT_EQ(hosts.back(), (IPv4{192, 168, 1, 254}));
}

TEST(NetworkRangeTest, SmallRanges) {
    EXPECT_EQ(NetworkRange(IPv4{10, 0, 0, 0}, 30).hosts().size(), 2u);
    EXPECT_EQ(NetworkRange(IPv4{10, 0, 0, 0}, 31).hosts().size(), 2u);
    auto single = NetworkRange(IPv4{10, 0, 0, 7}, 32).hosts();
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single.front(), (IPv4{10, 0, 0, 7}));
}

TEST(NetworkRangeTest, Contains) {
    NetworkRange range{IPv4{172, 16, 0, 0}, 12};
    EXPECT_TRUE(range.contains(IPv4{172, 31, 255, 1}));
    EXPECT_FALSE(range.contains(IPv4{172, 32, 0, 1}));
}
