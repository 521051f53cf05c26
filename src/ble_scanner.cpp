#include <lanwatch/ble_scanner.hpp>
#include <lanwatch/utils.hpp>

#include <spdlog/spdlog.h>

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <map>
#include <string_view>

constexpr uint8_t AD_SHORT_LOCAL_NAME = 0x08;
constexpr uint8_t AD_COMPLETE_LOCAL_NAME = 0x09;

std::string advertised_name(const uint8_t* data, size_t len) {
    std::string shortened;
    size_t pos = 0;
    while (pos < len) {
        const size_t field_len = data[pos];
        if (field_len == 0 || pos + 1 + field_len > len) {
            break;
        }
        const uint8_t type = data[pos + 1];
        // some peripherals pad the name with NULs
        auto value = std::string_view(reinterpret_cast<const char*>(data + pos + 2), field_len - 1);
        value = value.substr(0, value.find('\0'));
        if (type == AD_COMPLETE_LOCAL_NAME) {
            return std::string(value);
        } else if (type == AD_SHORT_LOCAL_NAME && shortened.empty()) {
            shortened.assign(value);
        }
        pos += 1 + field_len;
    }
    return shortened;
}

std::vector<Advertisement> parse_advertising_reports(const uint8_t* data, size_t len) {
    // count, then per report: event type, address type, address (LSB first),
    // data length, data, rssi
    std::vector<Advertisement> ret;
    if (len == 0) {
        return ret;
    }
    const size_t count = data[0];
    size_t pos = 1;
    for (size_t i = 0; i < count; ++i) {
        if (pos + 9 > len) {
            break;
        }
        const auto addr = data + pos + 2;
        const size_t data_len = data[pos + 8];
        if (pos + 9 + data_len + 1 > len) {
            break;
        }
        Advertisement adv;
        std::reverse_copy(addr, addr + adv.addr.size(), adv.addr.begin());
        adv.name = advertised_name(data + pos + 9, data_len);
        ret.push_back(std::move(adv));
        pos += 9 + data_len + 1;
    }
    return ret;
}

bool usable_name(const std::string& name) {
    return !name.empty() && name != PLACEHOLDER_NAME;
}

HciBleScanner::HciBleScanner(const Config& config) : dev_id_(config.hci_dev) {}

std::optional<std::vector<Advertisement>> HciBleScanner::listen(std::chrono::milliseconds window,
                                                               const CancelSignal* cancel) {
    auto dev_id = dev_id_ >= 0 ? dev_id_ : hci_get_route(nullptr);
    if (dev_id < 0) {
        spdlog::warn("no bluetooth adapter available");
        return std::nullopt;
    }
    auto dd = hci_open_dev(dev_id);
    if (dd < 0) {
        spdlog::warn("cannot open bluetooth adapter hci{}: {}", dev_id, strerror(errno));
        return std::nullopt;
    }
    auto close_dev = finally([dd] { hci_close_dev(dd); });

    // active scanning so that scan responses carrying names are requested
    if (hci_le_set_scan_parameters(dd, 0x01, htobs(0x0010), htobs(0x0010), LE_PUBLIC_ADDRESS, 0x00, 1000) < 0) {
        spdlog::warn("cannot set scan parameters on hci{}: {}", dev_id, strerror(errno));
        return std::nullopt;
    }
    if (hci_le_set_scan_enable(dd, 0x01, 0x00, 1000) < 0) {
        spdlog::warn("cannot enable scanning on hci{}: {}", dev_id, strerror(errno));
        return std::nullopt;
    }
    auto disable = finally([dd, dev_id] {
        if (hci_le_set_scan_enable(dd, 0x00, 0x00, 1000) < 0) {
            spdlog::debug("cannot disable scanning on hci{}: {}", dev_id, strerror(errno));
        }
    });

    hci_filter old_filter{};
    socklen_t old_len = sizeof(old_filter);
    if (getsockopt(dd, SOL_HCI, HCI_FILTER, &old_filter, &old_len) < 0) {
        spdlog::warn("cannot read HCI filter: {}", strerror(errno));
        return std::nullopt;
    }
    hci_filter filter{};
    hci_filter_clear(&filter);
    hci_filter_set_ptype(HCI_EVENT_PKT, &filter);
    hci_filter_set_event(EVT_LE_META_EVENT, &filter);
    if (setsockopt(dd, SOL_HCI, HCI_FILTER, &filter, sizeof(filter)) < 0) {
        spdlog::warn("cannot set HCI filter: {}", strerror(errno));
        return std::nullopt;
    }
    auto restore = finally([dd, &old_filter] {
        if (setsockopt(dd, SOL_HCI, HCI_FILTER, &old_filter, sizeof(old_filter)) < 0) {
            spdlog::debug("cannot restore HCI filter: {}", strerror(errno));
        }
    });

    spdlog::info("listening for bluetooth advertisements on hci{} for {}ms", dev_id, window.count());

    const bool have_cancel = cancel != nullptr && cancel->fd() >= 0;
    pollfd events[2] = {
        {dd, POLLIN, 0},
        {have_cancel ? cancel->fd() : -1, POLLIN, 0}
    };

    std::vector<Advertisement> ret;
    uint8_t buf[HCI_MAX_EVENT_SIZE];
    const auto deadline = std::chrono::steady_clock::now() + window;
    for (;;) {
        if (cancel != nullptr && cancel->cancelled()) {
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
        auto rc = poll(events, have_cancel ? 2 : 1, static_cast<int>(wait));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("failed to poll bluetooth adapter: {}", strerror(errno));
            break;
        } else if (rc == 0) {
            continue;
        }
        if (have_cancel && events[1].revents != 0) {
            break;
        }

        auto len = read(dd, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::warn("failed to read from bluetooth adapter: {}", strerror(errno));
            break;
        }
        // packet type, event header, then the LE meta event
        const size_t header = 1 + HCI_EVENT_HDR_SIZE;
        if (static_cast<size_t>(len) <= header + 1) {
            continue;
        }
        auto meta = reinterpret_cast<const evt_le_meta_event*>(buf + header);
        if (meta->subevent != EVT_LE_ADVERTISING_REPORT) {
            continue;
        }
        auto reports = parse_advertising_reports(meta->data, static_cast<size_t>(len) - header - 1);
        std::move(reports.begin(), reports.end(), std::back_inserter(ret));
    }

    return ret;
}

ShortRangeScanner::ShortRangeScanner(std::unique_ptr<BleScanner> scanner)
    : scanner_(std::move(scanner)) {}

std::optional<std::vector<ShortRangeDevice>> ShortRangeScanner::scan(std::chrono::milliseconds window,
                                                                     const CancelSignal* cancel) {
    if (!scanner_) {
        return std::nullopt;
    }
    auto adverts = scanner_->listen(window, cancel);
    if (!adverts) {
        return std::nullopt;
    }

    std::vector<ShortRangeDevice> ret;
    std::map<MAC, size_t> index;
    for (auto& adv : *adverts) {
        if (!usable_name(adv.name)) {
            continue;
        }
        auto it = index.find(adv.addr);
        if (it != index.end()) {
            ret[it->second].name = std::move(adv.name);
        } else {
            index.emplace(adv.addr, ret.size());
            ret.push_back({std::move(adv.name), adv.addr});
        }
    }
    spdlog::info("bluetooth scan complete, {} named devices", ret.size());
    return ret;
}
