#ifndef LANWATCH_RANGE_RESOLVER_HPP
#define LANWATCH_RANGE_RESOLVER_HPP

#include <lanwatch/net.hpp>

#include <memory>
#include <optional>
#include <string_view>

// Derives the local subnet from interface configuration text. The first
// qualifying address/mask pair in document order wins; link-local
// addresses never qualify. nullopt means no range could be found.
class RangeResolver {
  public:
    virtual ~RangeResolver() = default;

    virtual std::optional<NetworkRange> resolve(std::string_view config_text) const = 0;
    virtual const char* dialect() const = 0;
};

// Windows `ipconfig` output: "IPv4 Address" line followed by "Subnet Mask"
class IpconfigRangeResolver : public RangeResolver {
  public:
    std::optional<NetworkRange> resolve(std::string_view config_text) const override;
    const char* dialect() const override { return "ipconfig"; }
};

// iproute2 `ip addr` output, one-line or multi-line: "inet a.b.c.d/len".
// Loopback addresses are skipped as well.
class IpAddrRangeResolver : public RangeResolver {
  public:
    std::optional<NetworkRange> resolve(std::string_view config_text) const override;
    const char* dialect() const override { return "ip-addr"; }
};

class UnsupportedRangeResolver : public RangeResolver {
  public:
    std::optional<NetworkRange> resolve(std::string_view config_text) const override;
    const char* dialect() const override { return "unsupported"; }
};

// resolver for the platform this was built for
std::unique_ptr<RangeResolver> platform_range_resolver();

// picks the dialect by inspecting the text, falling back to the platform one
std::unique_ptr<RangeResolver> make_range_resolver(std::string_view config_text);

#endif
