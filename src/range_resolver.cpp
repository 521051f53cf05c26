#include <lanwatch/range_resolver.hpp>
#include <lanwatch/utils.hpp>

#include <spdlog/spdlog.h>

#include <charconv>

static std::string_view next_line(std::string_view& text) {
    auto [line, rest] = split(text, '\n');
    text = rest;
    return trim(line);
}

// "IPv4 Address. . . . . . : 10.0.0.5(Preferred)" -> {"IPv4 Address", "10.0.0.5"}
static std::pair<std::string_view, std::string_view> ipconfig_field(std::string_view line) {
    auto [key, value] = split(line, ':');
    while (!key.empty() && (key.back() == '.' || std::isspace(static_cast<unsigned char>(key.back())))) {
        key.remove_suffix(1);
    }
    value = trim(value);
    auto paren = value.find('(');
    if (paren != std::string_view::npos) {
        value = trim(value.substr(0, paren));
    }
    return {trim(key), value};
}

std::optional<NetworkRange> IpconfigRangeResolver::resolve(std::string_view config_text) const {
    std::optional<IPv4> pending;
    while (!config_text.empty()) {
        auto line = next_line(config_text);
        if (line.empty()) {
            continue;
        }
        auto [key, value] = ipconfig_field(line);
        if (key == "IPv4 Address" || key == "Autoconfiguration IPv4 Address") {
            pending = parse_ipv4(value);
            if (!pending) {
                spdlog::debug("unparseable IPv4 address '{}'", value);
            }
            continue;
        }
        if (pending && key == "Subnet Mask") {
            auto addr = *pending;
            pending.reset();
            auto mask = parse_ipv4(value);
            if (!mask) {
                spdlog::debug("unparseable subnet mask '{}'", value);
                continue;
            }
            if (is_link_local(addr)) {
                spdlog::debug("skipping link-local address {}", to_string(addr));
                continue;
            }
            auto range = NetworkRange::from_mask(addr, *mask);
            if (!range) {
                spdlog::debug("skipping {}: non-contiguous subnet mask {}", to_string(addr), to_string(*mask));
                continue;
            }
            return range;
        }
        // the mask has to directly follow its address
        pending.reset();
    }
    return std::nullopt;
}

std::optional<NetworkRange> IpAddrRangeResolver::resolve(std::string_view config_text) const {
    while (!config_text.empty()) {
        auto line = next_line(config_text);
        auto pos = line.find("inet ");
        if (pos == std::string_view::npos || (pos > 0 && !std::isspace(static_cast<unsigned char>(line[pos - 1])))) {
            continue;
        }
        auto token = trim_front(line.substr(pos + 5));
        token = token.substr(0, token.find_first_of(" \t"));
        auto [addr_str, len_str] = split(token, '/');
        auto addr = parse_ipv4(addr_str);
        unsigned prefix_len = 32;
        if (!len_str.empty()) {
            auto [end, ec] = std::from_chars(len_str.data(), len_str.data() + len_str.size(), prefix_len);
            if (ec != std::errc() || end != len_str.data() + len_str.size() || prefix_len > 32) {
                spdlog::debug("unparseable prefix length in '{}'", token);
                continue;
            }
        }
        if (!addr) {
            spdlog::debug("unparseable address in '{}'", token);
            continue;
        }
        if (is_link_local(*addr) || is_loopback(*addr)) {
            spdlog::debug("skipping {}", token);
            continue;
        }
        return NetworkRange{*addr, static_cast<uint8_t>(prefix_len)};
    }
    return std::nullopt;
}

std::optional<NetworkRange> UnsupportedRangeResolver::resolve(std::string_view) const {
    spdlog::error("automatic range detection is not implemented for this platform");
    return std::nullopt;
}

std::unique_ptr<RangeResolver> platform_range_resolver() {
#if defined(_WIN32)
    return std::make_unique<IpconfigRangeResolver>();
#elif defined(__linux__)
    return std::make_unique<IpAddrRangeResolver>();
#else
    return std::make_unique<UnsupportedRangeResolver>();
#endif
}

std::unique_ptr<RangeResolver> make_range_resolver(std::string_view config_text) {
    if (config_text.find("IPv4 Address") != std::string_view::npos) {
        return std::make_unique<IpconfigRangeResolver>();
    } else if (config_text.find("inet ") != std::string_view::npos) {
        return std::make_unique<IpAddrRangeResolver>();
    }
    return platform_range_resolver();
}
