#include <lanwatch/arp.hpp>

#include <algorithm>

static void put_be16(uint8_t* dst, uint16_t value) {
    dst[0] = static_cast<uint8_t>(value >> 8);
    dst[1] = static_cast<uint8_t>(value);
}

static uint16_t get_be16(const uint8_t* src) {
    return static_cast<uint16_t>((src[0] << 8) | src[1]);
}

ArpFrame make_arp_request(const MAC& src_mac, const IPv4& src_ip, const IPv4& target_ip) {
    ArpFrame frame{};
    auto p = frame.data();

    p = std::copy(BROADCAST_MAC.begin(), BROADCAST_MAC.end(), p);
    p = std::copy(src_mac.begin(), src_mac.end(), p);
    put_be16(p, ETHERTYPE_ARP_VALUE);
    p += 2;

    put_be16(p, 1);         // hardware type: ethernet
    put_be16(p + 2, 0x0800); // protocol type: IPv4
    p[4] = 6;
    p[5] = 4;
    put_be16(p + 6, ARP_OP_REQUEST);
    p += 8;

    p = std::copy(src_mac.begin(), src_mac.end(), p);
    p = std::copy(src_ip.begin(), src_ip.end(), p);
    p += 6; // target hardware address is unknown, left zeroed
    std::copy(target_ip.begin(), target_ip.end(), p);

    return frame;
}

std::optional<ArpPacket> parse_arp(const uint8_t* frame, size_t len) {
    if (frame == nullptr || len < ARP_FRAME_LEN) {
        return std::nullopt;
    }
    if (get_be16(frame + 12) != ETHERTYPE_ARP_VALUE) {
        return std::nullopt;
    }
    auto p = frame + 14;
    if (get_be16(p) != 1 || get_be16(p + 2) != 0x0800 || p[4] != 6 || p[5] != 4) {
        return std::nullopt;
    }

    ArpPacket ret{};
    ret.op = get_be16(p + 6);
    p += 8;
    std::copy(p, p + 6, ret.sender_mac.begin());
    std::copy(p + 6, p + 10, ret.sender_ip.begin());
    std::copy(p + 10, p + 16, ret.target_mac.begin());
    std::copy(p + 16, p + 20, ret.target_ip.begin());
    return ret;
}
