#include <lanwatch/net.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <charconv>

uint32_t to_uint(const IPv4& addr) noexcept {
    return (static_cast<uint32_t>(addr[0]) << 24) |
           (static_cast<uint32_t>(addr[1]) << 16) |
           (static_cast<uint32_t>(addr[2]) << 8) |
           static_cast<uint32_t>(addr[3]);
}

IPv4 from_uint(uint32_t value) noexcept {
    return IPv4{
        static_cast<uint8_t>(value >> 24),
        static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value)
    };
}

std::optional<IPv4> parse_ipv4(std::string_view s) {
    IPv4 ret{};
    for (size_t i = 0; i < ret.size(); ++i) {
        if (i > 0) {
            if (s.empty() || s.front() != '.') {
                return std::nullopt;
            }
            s.remove_prefix(1);
        }
        if (s.empty() || s.front() < '0' || s.front() > '9') {
            return std::nullopt;
        }
        unsigned octet = 0;
        auto [end, ec] = std::from_chars(s.data(), s.data() + std::min<size_t>(s.size(), 3), octet);
        if (ec != std::errc() || octet > 255) {
            return std::nullopt;
        }
        ret[i] = static_cast<uint8_t>(octet);
        s.remove_prefix(static_cast<size_t>(end - s.data()));
    }
    if (!s.empty()) {
        return std::nullopt;
    }
    return ret;
}

static int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    } else {
        return -1;
    }
}

std::optional<MAC> parse_mac(std::string_view s) {
    // xx:xx:xx:xx:xx:xx or xx-xx-xx-xx-xx-xx
    if (s.size() != 17) {
        return std::nullopt;
    }
    MAC ret{};
    for (size_t i = 0; i < ret.size(); ++i) {
        auto hi = hex_value(s[i * 3]);
        auto lo = hex_value(s[i * 3 + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        if (i + 1 < ret.size() && s[i * 3 + 2] != ':' && s[i * 3 + 2] != '-') {
            return std::nullopt;
        }
        ret[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return ret;
}

std::string to_string(const IPv4& addr) {
    return fmt::format("{}.{}.{}.{}", addr[0], addr[1], addr[2], addr[3]);
}

std::string to_string(const MAC& addr) {
    return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}",
        addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
}

bool is_link_local(const IPv4& addr) noexcept {
    return addr[0] == 169 && addr[1] == 254;
}

bool is_loopback(const IPv4& addr) noexcept {
    return addr[0] == 127;
}

std::optional<uint8_t> prefix_len_from_mask(const IPv4& mask) noexcept {
    auto bits = to_uint(mask);
    uint8_t prefix_len = 0;
    while (prefix_len < 32 && (bits & (0x80000000u >> prefix_len)) != 0) {
        ++prefix_len;
    }
    if (bits != to_uint(mask_from_prefix_len(prefix_len))) {
        return std::nullopt;
    }
    return prefix_len;
}

IPv4 mask_from_prefix_len(uint8_t prefix_len) noexcept {
    if (prefix_len == 0) {
        return from_uint(0);
    } else if (prefix_len >= 32) {
        return from_uint(0xffffffffu);
    }
    return from_uint(~((1u << (32 - prefix_len)) - 1));
}

NetworkRange::NetworkRange(const IPv4& addr, uint8_t prefix_len)
    : prefix_len_(prefix_len > 32 ? 32 : prefix_len) {
    base_ = from_uint(to_uint(addr) & to_uint(mask_from_prefix_len(prefix_len_)));
}

std::optional<NetworkRange> NetworkRange::from_mask(const IPv4& addr, const IPv4& mask) {
    auto prefix_len = prefix_len_from_mask(mask);
    if (!prefix_len) {
        return std::nullopt;
    }
    return NetworkRange{addr, *prefix_len};
}

std::optional<NetworkRange> NetworkRange::parse(std::string_view cidr) {
    auto slash = cidr.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }
    auto addr = parse_ipv4(cidr.substr(0, slash));
    auto len_str = cidr.substr(slash + 1);
    unsigned prefix_len = 0;
    auto [end, ec] = std::from_chars(len_str.data(), len_str.data() + len_str.size(), prefix_len);
    if (!addr || len_str.empty() || ec != std::errc() || end != len_str.data() + len_str.size() || prefix_len > 32) {
        return std::nullopt;
    }
    NetworkRange ret{*addr, static_cast<uint8_t>(prefix_len)};
    if (ret.base() != *addr) {
        return std::nullopt;
    }
    return ret;
}

IPv4 NetworkRange::mask() const noexcept {
    return mask_from_prefix_len(prefix_len_);
}

IPv4 NetworkRange::broadcast() const noexcept {
    return from_uint(to_uint(base_) | ~to_uint(mask()));
}

bool NetworkRange::contains(const IPv4& addr) const noexcept {
    return (to_uint(addr) & to_uint(mask())) == to_uint(base_);
}

uint64_t NetworkRange::host_count() const noexcept {
    const uint64_t total = uint64_t{1} << (32 - prefix_len_);
    return prefix_len_ >= 31 ? total : total - 2;
}

std::vector<IPv4> NetworkRange::hosts() const {
    std::vector<IPv4> ret;
    uint64_t first = to_uint(base_);
    uint64_t last = to_uint(broadcast());
    if (prefix_len_ < 31) {
        ++first;
        --last;
    }
    ret.reserve(static_cast<size_t>(last - first + 1));
    for (auto addr = first; addr <= last; ++addr) {
        ret.push_back(from_uint(static_cast<uint32_t>(addr)));
    }
    return ret;
}

std::string NetworkRange::to_string() const {
    return fmt::format("{}/{}", ::to_string(base_), prefix_len_);
}
