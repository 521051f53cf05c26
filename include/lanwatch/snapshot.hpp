#ifndef LANWATCH_SNAPSHOT_HPP
#define LANWATCH_SNAPSHOT_HPP

#include <lanwatch/net.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// reported in place of a hostname when reverse resolution fails
constexpr const char* UNRESOLVED_NAME = "N/A";

struct WiredHost {
    IPv4 addr{};
    MAC mac{};
    std::optional<std::string> name;

    const std::string& display_name() const;
};

struct ShortRangeDevice {
    std::string name;
    MAC addr{};
};

// Immutable result of one scan. Hosts are ordered by address, devices by
// name (byte-wise, so case-sensitive).
class ResultSnapshot {
  private:
    std::vector<WiredHost> wired_hosts_;
    std::vector<ShortRangeDevice> short_range_devices_;
    NetworkRange range_;
    std::chrono::system_clock::time_point timestamp_;
    std::vector<std::string> warnings_;

  public:
    ResultSnapshot(std::vector<WiredHost> wired_hosts,
                   std::vector<ShortRangeDevice> short_range_devices,
                   const NetworkRange& range,
                   std::chrono::system_clock::time_point timestamp,
                   std::vector<std::string> warnings = {});

    const std::vector<WiredHost>& wired_hosts() const noexcept { return wired_hosts_; }
    const std::vector<ShortRangeDevice>& short_range_devices() const noexcept { return short_range_devices_; }
    const NetworkRange& range() const noexcept { return range_; }
    std::chrono::system_clock::time_point timestamp() const noexcept { return timestamp_; }

    // degraded conditions absorbed during the scan
    const std::vector<std::string>& warnings() const noexcept { return warnings_; }
    bool degraded() const noexcept { return !warnings_.empty(); }
};

#endif
