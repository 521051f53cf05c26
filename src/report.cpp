#include <lanwatch/report.hpp>

#include <spdlog/fmt/fmt.h>

#include <initializer_list>
#include <vector>

namespace {

constexpr size_t IDX_WIDTH = 5;
constexpr size_t IP_WIDTH = 18;
constexpr size_t MAC_WIDTH = 17;

std::string repeat(const char* s, size_t n) {
    std::string ret;
    for (size_t i = 0; i < n; ++i) {
        ret += s;
    }
    return ret;
}

std::string border(std::initializer_list<size_t> widths, const char* left, const char* mid, const char* right) {
    std::string ret = left;
    bool first = true;
    for (auto width : widths) {
        if (!first) {
            ret += mid;
        }
        first = false;
        ret += repeat("═", width + 2);
    }
    ret += right;
    return ret;
}

size_t inner_width(std::initializer_list<size_t> widths) {
    size_t ret = 0;
    for (auto width : widths) {
        ret += width + 2;
    }
    return ret + widths.size() - 1;
}

std::string truncate(const std::string& s, size_t width) {
    return s.size() > width ? s.substr(0, width) : s;
}

std::string centered_row(const std::string& text, size_t width) {
    return fmt::format("║{:^{}}║\n", truncate(text, width), width);
}

} // namespace

std::string render_wired_table(const std::vector<WiredHost>& hosts) {
    const auto widths = {IDX_WIDTH, IP_WIDTH, MAC_WIDTH, NAME_COLUMN_WIDTH};
    const auto inner = inner_width(widths);

    std::string out;
    out += border(widths, "╔", "╦", "╗") + "\n";
    out += centered_row(fmt::format(" LAN Watch: Wi-Fi Network ({} Devices) ", hosts.size()), inner);
    out += border(widths, "╠", "╬", "╣") + "\n";
    out += fmt::format("║ {:^{}} ║ {:^{}} ║ {:^{}} ║ {:^{}} ║\n",
        "#", IDX_WIDTH, "IP Address", IP_WIDTH, "MAC Address", MAC_WIDTH,
        "Device Name (Hostname)", NAME_COLUMN_WIDTH);
    out += border(widths, "╠", "╬", "╣") + "\n";
    if (hosts.empty()) {
        out += centered_row("No devices found on the network.", inner);
    }
    size_t idx = 0;
    for (const auto& host : hosts) {
        out += fmt::format("║ {:<{}} ║ {:<{}} ║ {:<{}} ║ {:<{}} ║\n",
            ++idx, IDX_WIDTH, to_string(host.addr), IP_WIDTH, to_string(host.mac), MAC_WIDTH,
            truncate(host.display_name(), NAME_COLUMN_WIDTH), NAME_COLUMN_WIDTH);
    }
    out += border(widths, "╚", "╩", "╝") + "\n";
    return out;
}

std::string render_short_range_table(const std::vector<ShortRangeDevice>& devices) {
    const auto widths = {IDX_WIDTH, NAME_COLUMN_WIDTH, MAC_WIDTH};
    const auto inner = inner_width(widths);

    std::string out;
    out += border(widths, "╔", "╦", "╗") + "\n";
    out += centered_row(fmt::format(" LAN Watch: Bluetooth ({} Devices) ", devices.size()), inner);
    out += border(widths, "╠", "╬", "╣") + "\n";
    out += fmt::format("║ {:^{}} ║ {:^{}} ║ {:^{}} ║\n",
        "#", IDX_WIDTH, "Device Name", NAME_COLUMN_WIDTH, "MAC Address", MAC_WIDTH);
    out += border(widths, "╠", "╬", "╣") + "\n";
    if (devices.empty()) {
        out += centered_row("No devices found.", inner);
    }
    size_t idx = 0;
    for (const auto& dev : devices) {
        out += fmt::format("║ {:<{}} ║ {:<{}} ║ {:<{}} ║\n",
            ++idx, IDX_WIDTH, truncate(dev.name, NAME_COLUMN_WIDTH), NAME_COLUMN_WIDTH, to_string(dev.addr), MAC_WIDTH);
    }
    out += border(widths, "╚", "╩", "╝") + "\n";
    return out;
}

std::string render_report(const ResultSnapshot& snapshot) {
    std::string out;
    out += fmt::format("Network range: {}\n\n", snapshot.range().to_string());
    out += render_wired_table(snapshot.wired_hosts());
    out += "\n";
    out += render_short_range_table(snapshot.short_range_devices());
    for (const auto& warning : snapshot.warnings()) {
        out += fmt::format("[!] {}\n", warning);
    }
    return out;
}
