#ifndef LANWATCH_ARP_HPP
#define LANWATCH_ARP_HPP

#include <lanwatch/net.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

// Ethernet II header + ARP payload for IPv4 over Ethernet
constexpr size_t ARP_FRAME_LEN = 42;

constexpr uint16_t ETHERTYPE_ARP_VALUE = 0x0806;
constexpr uint16_t ARP_OP_REQUEST = 1;
constexpr uint16_t ARP_OP_REPLY = 2;

constexpr MAC BROADCAST_MAC{0xff, 0xff, 0xff, 0xff, 0xff, 0xff};

using ArpFrame = std::array<uint8_t, ARP_FRAME_LEN>;

struct ArpPacket {
    uint16_t op;
    MAC sender_mac;
    IPv4 sender_ip;
    MAC target_mac;
    IPv4 target_ip;
};

// broadcast "who-has target_ip, tell src_ip" request
ArpFrame make_arp_request(const MAC& src_mac, const IPv4& src_ip, const IPv4& target_ip);

// nullopt unless the frame is a well-formed Ethernet/IPv4 ARP packet
std::optional<ArpPacket> parse_arp(const uint8_t* frame, size_t len);

#endif
