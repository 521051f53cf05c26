#ifndef LANWATCH_BLE_SCANNER_HPP
#define LANWATCH_BLE_SCANNER_HPP

#include <lanwatch/cancel.hpp>
#include <lanwatch/config.hpp>
#include <lanwatch/snapshot.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// advertised by peripherals that have not been given a name
constexpr const char* PLACEHOLDER_NAME = "Unknown";

struct Advertisement {
    MAC addr{};
    std::string name;
};

// Name from the Complete (0x09) or Shortened (0x08) Local Name AD structure.
// The complete name is preferred when both are present.
std::string advertised_name(const uint8_t* data, size_t len);

// Reports carried by an LE Advertising Report subevent, starting at the
// report count byte.
std::vector<Advertisement> parse_advertising_reports(const uint8_t* data, size_t len);

bool usable_name(const std::string& name);

// Passive listener on the local short-range radio. nullopt means the
// adapter could not be engaged.
class BleScanner {
  public:
    virtual ~BleScanner() = default;

    virtual std::optional<std::vector<Advertisement>> listen(std::chrono::milliseconds window,
                                                             const CancelSignal* cancel) = 0;
};

// LE scanning on a BlueZ HCI socket
class HciBleScanner : public BleScanner {
  private:
    int dev_id_;

  public:
    explicit HciBleScanner(const Config& config);

    std::optional<std::vector<Advertisement>> listen(std::chrono::milliseconds window,
                                                     const CancelSignal* cancel) override;
};

// Keeps one entry per advertising address carrying a usable name; the most
// recent usable name wins.
class ShortRangeScanner {
  private:
    std::unique_ptr<BleScanner> scanner_;

  public:
    explicit ShortRangeScanner(std::unique_ptr<BleScanner> scanner);

    std::optional<std::vector<ShortRangeDevice>> scan(std::chrono::milliseconds window,
                                                      const CancelSignal* cancel = nullptr);
};

#endif
