#include <lanwatch/device.hpp>
#include <lanwatch/utils.hpp>

#include <cstring>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/types.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>

#include <algorithm>

static std::string_view iface_name(int id) {
    static thread_local char if_name[IF_NAMESIZE];
    auto name = if_indextoname(id, if_name);
    if (name == nullptr) {
        return std::string_view();
    } else {
        return name;
    }
}

Device::Device(int id) : id_(id) {}

Device::Device(const std::string& name)
    : Device(name.c_str()) {}

Device::Device(const char* name)
    : id_(static_cast<int>(if_nametoindex(name))) {}

std::vector<Device> Device::all() {
    std::vector<Device> ret;
    struct if_nameindex* names = if_nameindex();
    if (names == nullptr) {
        return ret;
    }
    auto guard = finally([names] { if_freenameindex(names); });
    for (auto entry = names; entry->if_index != 0 && entry->if_name != nullptr; ++entry) {
        ret.emplace_back(static_cast<int>(entry->if_index));
    }
    std::sort(ret.begin(), ret.end(), [](const Device& a, const Device& b) {
        return a.id() < b.id();
    });
    return ret;
}

std::optional<Device> Device::for_range(const NetworkRange& range) {
    for (auto& dev : all()) {
        for (const auto& subnet : dev.ipv4_addrs()) {
            if (range.contains(subnet.addr)) {
                return dev;
            }
        }
    }
    return std::nullopt;
}

int Device::id() const {
    return id_;
}

std::string Device::name() const {
    return std::string(iface_name(id_));
}

bool Device::exists() const {
    return id_ != 0 && !iface_name(id_).empty();
}

std::vector<IPv4Subnet> Device::ipv4_addrs() const {
    std::vector<IPv4Subnet> ret;
    struct ifaddrs* addrs;
    if (getifaddrs(&addrs) == 0) {
        auto guard = finally([addrs] { freeifaddrs(addrs); });
        auto name = iface_name(id_);
        for (auto addr = addrs; addr != nullptr; addr = addr->ifa_next) {
            if (addr->ifa_addr != nullptr && addr->ifa_netmask != nullptr && name == addr->ifa_name) {
                if (addr->ifa_addr->sa_family == AF_INET && (addr->ifa_flags & IFF_UP) != 0) {
                    IPv4Subnet val;
                    std::memcpy(val.addr.data(), &((struct sockaddr_in *)addr->ifa_addr)->sin_addr.s_addr, 4);
                    std::memcpy(val.mask.data(), &((struct sockaddr_in *)addr->ifa_netmask)->sin_addr.s_addr, 4);
                    ret.push_back(val);
                }
            }
        }
    }
    return ret;
}

std::optional<MAC> Device::mac_addr() const {
    struct ifaddrs* addrs;
    if (getifaddrs(&addrs) == 0) {
        auto guard = finally([addrs] { freeifaddrs(addrs); });
        auto name = iface_name(id_);
        for (auto addr = addrs; addr != nullptr; addr = addr->ifa_next) {
            if (addr->ifa_addr != nullptr && name == addr->ifa_name) {
                if (addr->ifa_addr->sa_family == AF_PACKET) {
                    MAC ret;
                    std::memcpy(ret.data(), ((struct sockaddr_ll*)addr->ifa_addr)->sll_addr, 6);
                    return ret;
                }
            }
        }
    }
    return std::nullopt;
}
