#include <gtest/gtest.h>

#include <lanwatch/report.hpp>

TEST(ReportTest, WiredTableListsHostsInOrder) {
    ResultSnapshot snapshot{
        {
            WiredHost{IPv4{10, 0, 0, 2}, MAC{0x11, 0x22, 0x33, 0x44, 0x55, 0x66}, std::string(UNRESOLVED_NAME)},
            WiredHost{IPv4{10, 0, 0, 1}, MAC{0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff}, std::string("router.local")},
        },
        {},
        NetworkRange{IPv4{10, 0, 0, 0}, 24},
        std::chrono::system_clock::now()
    };
    auto out = render_wired_table(snapshot.wired_hosts());

    EXPECT_NE(out.find("LAN Watch: Wi-Fi Network (2 Devices)"), std::string::npos);
    EXPECT_NE(out.find("Device Name (Hostname)"), std::string::npos);
    auto first = out.find("10.0.0.1 ");
    auto second = out.find("10.0.0.2 ");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_NE(out.find("router.local"), std::string::npos);
    EXPECT_NE(out.find("N/A"), std::string::npos);
}

TEST(ReportTest, LongNamesAreTruncated) {
    std::vector<ShortRangeDevice> devices{{std::string(40, 'x'), MAC{0x00, 0x11, 0x22, 0x33, 0x44, 0x55}}};
    auto out = render_short_range_table(devices);
    EXPECT_NE(out.find(std::string(NAME_COLUMN_WIDTH, 'x')), std::string::npos);
    EXPECT_EQ(out.find(std::string(NAME_COLUMN_WIDTH + 1, 'x')), std::string::npos);
    EXPECT_NE(out.find("00:11:22:33:44:55"), std::string::npos);
}

TEST(ReportTest, EmptyTables) {
    EXPECT_NE(render_wired_table({}).find("No devices found on the network."), std::string::npos);
    EXPECT_NE(render_short_range_table({}).find("No devices found."), std::string::npos);
}

TEST(ReportTest, ReportCarriesRangeAndWarnings) {
    ResultSnapshot snapshot{{}, {}, NetworkRange{IPv4{192, 168, 1, 0}, 24},
        std::chrono::system_clock::now(), {"short-range scan: adapter unavailable"}};
    auto out = render_report(snapshot);
    EXPECT_NE(out.find("Network range: 192.168.1.0/24"), std::string::npos);
    EXPECT_NE(out.find("Bluetooth (0 Devices)"), std::string::npos);
    EXPECT_NE(out.find("[!] short-range scan: adapter unavailable"), std::string::npos);
}
