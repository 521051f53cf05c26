#include <lanwatch/snapshot.hpp>

#include <algorithm>

const std::string& WiredHost::display_name() const {
    static const std::string unresolved{UNRESOLVED_NAME};
    return name ? *name : unresolved;
}

ResultSnapshot::ResultSnapshot(std::vector<WiredHost> wired_hosts,
                               std::vector<ShortRangeDevice> short_range_devices,
                               const NetworkRange& range,
                               std::chrono::system_clock::time_point timestamp,
                               std::vector<std::string> warnings)
    : wired_hosts_(std::move(wired_hosts)),
      short_range_devices_(std::move(short_range_devices)),
      range_(range),
      timestamp_(timestamp),
      warnings_(std::move(warnings)) {
    std::stable_sort(wired_hosts_.begin(), wired_hosts_.end(), [](const WiredHost& a, const WiredHost& b) {
        return to_uint(a.addr) < to_uint(b.addr);
    });
    std::stable_sort(short_range_devices_.begin(), short_range_devices_.end(),
        [](const ShortRangeDevice& a, const ShortRangeDevice& b) {
            return a.name < b.name;
        });
}
