#include <lanwatch/sysinfo.hpp>
#include <lanwatch/device.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

bool is_elevated() {
    return geteuid() == 0;
}

std::string interface_config_text() {
    std::string ret;
    for (const auto& dev : Device::all()) {
        auto name = dev.name();
        for (const auto& subnet : dev.ipv4_addrs()) {
            auto prefix_len = prefix_len_from_mask(subnet.mask);
            if (!prefix_len) {
                spdlog::debug("skipping {} on {}: non-contiguous netmask {}",
                    to_string(subnet.addr), name, to_string(subnet.mask));
                continue;
            }
            NetworkRange range{subnet.addr, *prefix_len};
            ret += fmt::format("{}: {}    inet {}/{} brd {} scope {} {}\n",
                dev.id(), name, to_string(subnet.addr), *prefix_len,
                to_string(range.broadcast()),
                is_loopback(subnet.addr) ? "host" : "global", name);
        }
    }
    return ret;
}

std::string read_text_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::error("{} does not exist", path);
        return std::string();
    }
    std::ifstream file{path};
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}
