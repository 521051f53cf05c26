#include <lanwatch/prober.hpp>
#include <lanwatch/arp.hpp>
#include <lanwatch/device.hpp>
#include <lanwatch/utils.hpp>

#include <spdlog/spdlog.h>

#include <pcap.h>
#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

// a /16 is 65534 frames, anything wider floods the segment
constexpr uint8_t MIN_PREFIX_LEN = 16;

bool ReplyTable::add_frame(const uint8_t* bytes, size_t len) {
    auto arp = parse_arp(bytes, len);
    if (!arp || arp->op != ARP_OP_REPLY) {
        return false;
    }
    if (arp->sender_mac == own_mac_) {
        return false;
    }
    auto& host = hosts_[to_uint(arp->sender_ip)];
    if (host.addr == arp->sender_ip && host.mac != arp->sender_mac) {
        spdlog::debug("{} answered from {} after {}", to_string(arp->sender_ip),
            to_string(arp->sender_mac), to_string(host.mac));
    }
    host.addr = arp->sender_ip;
    host.mac = arp->sender_mac;
    return true;
}

std::vector<WiredHost> ReplyTable::hosts() const {
    std::vector<WiredHost> ret;
    ret.reserve(hosts_.size());
    for (const auto& entry : hosts_) {
        ret.push_back(entry.second);
    }
    return ret;
}

PcapProber::PcapProber(const Config& config)
    : iface_(config.iface),
      snaplen_(config.snaplen) {}

pcap* PcapProber::open(const std::string& iface, std::vector<std::string>& warnings) {
    char err_buf[PCAP_ERRBUF_SIZE];
    pcap_t* pcap = pcap_create(iface.c_str(), err_buf);
    if (pcap == nullptr) {
        warnings.push_back(fmt::format("cannot open {}: {}", iface, err_buf));
        return nullptr;
    }
    auto guard = finally([&pcap] {
        if (pcap != nullptr) {
            pcap_close(pcap);
        }
    });

    pcap_set_snaplen(pcap, snaplen_);
    pcap_set_promisc(pcap, 0);
    pcap_set_immediate_mode(pcap, 1);

    switch (pcap_activate(pcap)) {
        case 0:
            break;
        case PCAP_WARNING:
            spdlog::warn("{}", pcap_geterr(pcap));
            break;
        case PCAP_WARNING_TSTAMP_TYPE_NOTSUP:
        case PCAP_WARNING_PROMISC_NOTSUP:
            break;
        case PCAP_ERROR_NO_SUCH_DEVICE:
            warnings.push_back(fmt::format("no such interface {}: {}", iface, pcap_geterr(pcap)));
            return nullptr;
        case PCAP_ERROR_PERM_DENIED:
            warnings.push_back(fmt::format("permission denied on {}: {}", iface, pcap_geterr(pcap)));
            return nullptr;
        case PCAP_ERROR_IFACE_NOT_UP:
            warnings.push_back(fmt::format("interface {} is not up", iface));
            return nullptr;
        default:
            warnings.push_back(fmt::format("cannot activate {}: {}", iface, pcap_geterr(pcap)));
            return nullptr;
    }

    if (pcap_datalink(pcap) != DLT_EN10MB) {
        warnings.push_back(fmt::format("interface {} is not an ethernet link", iface));
        return nullptr;
    }

    if (pcap_setnonblock(pcap, 1, err_buf) != 0) {
        warnings.push_back(fmt::format("unable to put {} in non-blocking mode: {}", iface, err_buf));
        return nullptr;
    }

    bpf_program prog{};
    if (pcap_compile(pcap, &prog, "arp", 1, PCAP_NETMASK_UNKNOWN) != 0) {
        warnings.push_back(fmt::format("failed to compile filter: {}", pcap_geterr(pcap)));
        return nullptr;
    }
    auto free_prog = finally([&prog] { pcap_freecode(&prog); });
    if (pcap_setfilter(pcap, &prog) != 0) {
        warnings.push_back(fmt::format("failed to apply filter: {}", pcap_geterr(pcap)));
        return nullptr;
    }

    pcap_t* ret = nullptr;
    std::swap(ret, pcap);
    return ret;
}

static void reply_callback(u_char* user, const pcap_pkthdr* h, const u_char* bytes) {
    reinterpret_cast<ReplyTable*>(user)->add_frame(bytes, h->caplen);
}

void PcapProber::listen(pcap* handle, ReplyTable& replies, std::chrono::steady_clock::time_point deadline,
                        const CancelSignal* cancel, std::vector<std::string>& warnings) {
    const bool have_cancel = cancel != nullptr && cancel->fd() >= 0;
    pollfd events[2] = {
        {
            pcap_get_selectable_fd(handle),
            POLLIN,
            0
        },
        {
            have_cancel ? cancel->fd() : -1,
            POLLIN,
            0
        }
    };
    auto& pcap_poll = events[0];
    auto& cancel_poll = events[1];

    int max_wait = -1;
    auto timeout_ptr = pcap_get_required_select_timeout(handle);
    if (timeout_ptr != nullptr) {
        max_wait = static_cast<int>(timeout_ptr->tv_sec * 1000 + timeout_ptr->tv_usec / 1000);
    }

    // late responders inside the window count, so keep listening until the deadline
    for (;;) {
        if (cancel != nullptr && cancel->cancelled()) {
            return;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
        int wait = static_cast<int>(remaining);
        if (max_wait >= 0) {
            wait = std::min(wait, max_wait);
        }

        switch (poll(events, have_cancel ? 2 : 1, wait)) {
            case -1:
                if (errno == EINTR) {
                    continue;
                }
                warnings.push_back(fmt::format("failed to poll interface: {}", strerror(errno)));
                return;
            case 0:
                if (max_wait < 0) {
                    continue;
                }
                break;
            default:
                break;
        }

        if (have_cancel && cancel_poll.revents != 0) {
            return;
        }

        if (pcap_poll.revents != 0 || max_wait >= 0) {
            if (pcap_dispatch(handle, -1, reply_callback, reinterpret_cast<u_char*>(&replies)) == PCAP_ERROR) {
                warnings.push_back(fmt::format("capture error: {}", pcap_geterr(handle)));
                return;
            }
        }
    }
}

ProbeResult PcapProber::probe(const NetworkRange& range, std::chrono::milliseconds timeout,
                              const CancelSignal* cancel) {
    ProbeResult result;

    if (range.prefix_len() < MIN_PREFIX_LEN) {
        result.warnings.push_back(fmt::format("refusing to probe {}: ranges wider than /{} are not swept",
            range.to_string(), MIN_PREFIX_LEN));
        return result;
    }

    std::optional<Device> dev;
    if (!iface_.empty()) {
        dev = Device{iface_};
        if (!dev->exists()) {
            result.warnings.push_back(fmt::format("no such interface {}", iface_));
            return result;
        }
    } else {
        dev = Device::for_range(range);
        if (!dev) {
            result.warnings.push_back(fmt::format("no local interface has an address in {}", range.to_string()));
            return result;
        }
    }
    auto iface = dev->name();

    auto mac = dev->mac_addr();
    if (!mac) {
        result.warnings.push_back(fmt::format("interface {} has no hardware address", iface));
        return result;
    }
    auto subnets = dev->ipv4_addrs();
    if (subnets.empty()) {
        result.warnings.push_back(fmt::format("interface {} has no IPv4 address", iface));
        return result;
    }
    auto own = std::find_if(subnets.begin(), subnets.end(), [&range](const IPv4Subnet& s) {
        return range.contains(s.addr);
    });
    const IPv4 src_ip = own != subnets.end() ? own->addr : subnets.front().addr;

    auto handle = open(iface, result.warnings);
    if (handle == nullptr) {
        return result;
    }
    auto guard = finally([handle] { pcap_close(handle); });

    spdlog::info("probing {} ({} hosts) from {} on {}", range.to_string(), range.host_count(),
        to_string(src_ip), iface);

    ReplyTable replies{*mac};
    size_t sent = 0;
    size_t failed = 0;
    std::string last_error;
    for (const auto& target : range.hosts()) {
        if (cancel != nullptr && cancel->cancelled()) {
            return result;
        }
        if (target == src_ip) {
            continue;
        }
        auto frame = make_arp_request(*mac, src_ip, target);
        if (pcap_sendpacket(handle, frame.data(), static_cast<int>(frame.size())) != 0) {
            ++failed;
            last_error = pcap_geterr(handle);
            spdlog::debug("failed to send probe to {}: {}", to_string(target), last_error);
        } else {
            ++sent;
        }
    }
    if (failed > 0) {
        result.warnings.push_back(fmt::format("{} of {} probes could not be sent: {}",
            failed, failed + sent, last_error));
    }
    spdlog::debug("sent {} probes, listening for {}ms", sent, timeout.count());

    listen(handle, replies, std::chrono::steady_clock::now() + timeout, cancel, result.warnings);

    result.hosts = replies.hosts();
    spdlog::info("link-layer probe complete, {} hosts answered", result.hosts.size());
    return result;
}
