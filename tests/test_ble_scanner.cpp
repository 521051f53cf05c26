#include <gtest/gtest.h>

#include <lanwatch/ble_scanner.hpp>

#include <memory>
#include <vector>

namespace {

class StubBleScanner : public BleScanner {
  public:
    std::optional<std::vector<Advertisement>> adverts;
    std::chrono::milliseconds window{0};

    std::optional<std::vector<Advertisement>> listen(std::chrono::milliseconds w, const CancelSignal*) override {
        window = w;
        return adverts;
    }
};

Advertisement advert(const char* mac, const char* name) {
    return Advertisement{*parse_mac(mac), name};
}

} // namespace

TEST(AdvertisedNameTest, PrefersCompleteName) {
    const uint8_t data[] = {
        0x02, 0x01, 0x06,                     // flags
        0x04, 0x08, 'S', 'p', 'k',            // shortened name
        0x08, 0x09, 'S', 'p', 'e', 'a', 'k', 'e', 'r'
    };
    EXPECT_EQ(advertised_name(data, sizeof(data)), "Speaker");
}

TEST(AdvertisedNameTest, FallsBackToShortenedName) {
    const uint8_t data[] = {0x02, 0x01, 0x06, 0x04, 0x08, 'S', 'p', 'k'};
    EXPECT_EQ(advertised_name(data, sizeof(data)), "Spk");
}

TEST(AdvertisedNameTest, NamelessAndTruncatedData) {
    const uint8_t flags_only[] = {0x02, 0x01, 0x06};
    EXPECT_EQ(advertised_name(flags_only, sizeof(flags_only)), "");

    const uint8_t truncated[] = {0x09, 0x09, 'S', 'p'};
    EXPECT_EQ(advertised_name(truncated, sizeof(truncated)), "");

    const uint8_t padded[] = {0x06, 0x09, 'T', 'a', 'g', 0x00, 0x00};
    EXPECT_EQ(advertised_name(padded, sizeof(padded)), "Tag");
}

TEST(AdvertisingReportTest, ParsesEveryReport) {
    const uint8_t data[] = {
        0x02,
        // connectable advertisement, public address 00:11:22:33:44:55
        0x00, 0x00, 0x55, 0x44, 0x33, 0x22, 0x11, 0x00,
        0x05, 0x04, 0x09, 'L', 'a', 'm',
        0xc4,
        // scan response from random address C0:FF:EE:00:00:01 without a name
        0x04, 0x01, 0x01, 0x00, 0x00, 0xee, 0xff, 0xc0,
        0x03, 0x02, 0x01, 0x06,
        0xb0
    };
    auto reports = parse_advertising_reports(data, sizeof(data));
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(to_string(reports[0].addr), "00:11:22:33:44:55");
    EXPECT_EQ(reports[0].name, "Lam");
    EXPECT_EQ(to_string(reports[1].addr), "c0:ff:ee:00:00:01");
    EXPECT_EQ(reports[1].name, "");
}

TEST(AdvertisingReportTest, StopsAtTruncatedReport) {
    const uint8_t data[] = {0x02, 0x00, 0x00, 0x55, 0x44, 0x33, 0x22, 0x11, 0x00, 0x10, 0x02};
    EXPECT_TRUE(parse_advertising_reports(data, sizeof(data)).empty());
}

TEST(ShortRangeScannerTest, DropsNamelessAndPlaceholderDevices) {
    auto stub = std::make_unique<StubBleScanner>();
    stub->adverts = std::vector<Advertisement>{
        advert("00:11:22:33:44:55", "Speaker"),
        advert("00:11:22:33:44:56", ""),
        advert("00:11:22:33:44:57", "Unknown"),
        advert("00:11:22:33:44:58", "unknown"),
    };
    ShortRangeScanner scanner{std::move(stub)};

    auto devices = scanner.scan(std::chrono::milliseconds(10));
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 2u);
    EXPECT_EQ((*devices)[0].name, "Speaker");
    EXPECT_EQ(to_string((*devices)[0].addr), "00:11:22:33:44:55");
    EXPECT_EQ((*devices)[1].name, "unknown");
}

TEST(ShortRangeScannerTest, OneEntryPerAddress) {
    auto stub = std::make_unique<StubBleScanner>();
    stub->adverts = std::vector<Advertisement>{
        advert("00:11:22:33:44:55", "Spk"),
        advert("00:11:22:33:44:55", ""),
        advert("00:11:22:33:44:55", "Speaker"),
    };
    ShortRangeScanner scanner{std::move(stub)};

    auto devices = scanner.scan(std::chrono::milliseconds(10));
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 1u);
    EXPECT_EQ(devices->front().name, "Speaker");
    EXPECT_EQ(devices->front().addr, (MAC{0x00, 0x11, 0x22, 0x33, 0x44, 0x55}));
}

TEST(ShortRangeScannerTest, AdapterUnavailable) {
    auto stub = std::make_unique<StubBleScanner>();
    auto raw = stub.get();
    ShortRangeScanner scanner{std::move(stub)};

    EXPECT_FALSE(scanner.scan(std::chrono::milliseconds(1500)).has_value());
    EXPECT_EQ(raw->window, std::chrono::milliseconds(1500));
}
