#ifndef LANWATCH_NET_HPP
#define LANWATCH_NET_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using IPv4 = std::array<uint8_t, 4>;
using MAC = std::array<uint8_t, 6>;

uint32_t to_uint(const IPv4& addr) noexcept;
IPv4 from_uint(uint32_t value) noexcept;

std::optional<IPv4> parse_ipv4(std::string_view s);
std::optional<MAC> parse_mac(std::string_view s);

std::string to_string(const IPv4& addr);
std::string to_string(const MAC& addr);

bool is_link_local(const IPv4& addr) noexcept;
bool is_loopback(const IPv4& addr) noexcept;

// number of leading one bits, or nullopt if the mask is not contiguous
std::optional<uint8_t> prefix_len_from_mask(const IPv4& mask) noexcept;
IPv4 mask_from_prefix_len(uint8_t prefix_len) noexcept;

class NetworkRange {
  private:
    IPv4 base_{};
    uint8_t prefix_len_{0};

  public:
    NetworkRange() = default;

    // host bits of addr are cleared
    NetworkRange(const IPv4& addr, uint8_t prefix_len);

    static std::optional<NetworkRange> from_mask(const IPv4& addr, const IPv4& mask);

    // "a.b.c.d/len"; host bits must be zero
    static std::optional<NetworkRange> parse(std::string_view cidr);

    const IPv4& base() const noexcept { return base_; }
    uint8_t prefix_len() const noexcept { return prefix_len_; }
    IPv4 mask() const noexcept;
    IPv4 broadcast() const noexcept;

    bool contains(const IPv4& addr) const noexcept;

    // usable host addresses; network and broadcast addresses are excluded
    // except for /31 and /32, which have none to exclude
    std::vector<IPv4> hosts() const;
    uint64_t host_count() const noexcept;

    std::string to_string() const;

    bool operator==(const NetworkRange& other) const noexcept {
        return base_ == other.base_ && prefix_len_ == other.prefix_len_;
    }
    bool operator!=(const NetworkRange& other) const noexcept {
        return !(*this == other);
    }
};

#endif
