#ifndef LANWATCH_PROBER_HPP
#define LANWATCH_PROBER_HPP

#include <lanwatch/cancel.hpp>
#include <lanwatch/config.hpp>
#include <lanwatch/snapshot.hpp>

#include <chrono>
#include <map>
#include <string>
#include <vector>

extern "C" {
struct pcap;
}

struct ProbeResult {
    std::vector<WiredHost> hosts;
    std::vector<std::string> warnings;
};

// Link-layer discovery over a range. Never fails: transport problems are
// reported through ProbeResult::warnings next to whatever was collected.
class Prober {
  public:
    virtual ~Prober() = default;

    virtual ProbeResult probe(const NetworkRange& range, std::chrono::milliseconds timeout,
                              const CancelSignal* cancel) = 0;
};

// Collects ARP replies by sender address. A later reply for the same
// address replaces an earlier one.
class ReplyTable {
  private:
    std::map<uint32_t, WiredHost> hosts_;
    MAC own_mac_{};

  public:
    explicit ReplyTable(const MAC& own_mac) : own_mac_(own_mac) {}

    // returns true if the frame was an ARP reply
    bool add_frame(const uint8_t* bytes, size_t len);

    size_t size() const { return hosts_.size(); }
    std::vector<WiredHost> hosts() const;
};

// Sends one broadcast ARP request per host in the range through libpcap and
// listens for replies for the whole timeout window.
class PcapProber : public Prober {
  public:
    explicit PcapProber(const Config& config);

    ProbeResult probe(const NetworkRange& range, std::chrono::milliseconds timeout,
                      const CancelSignal* cancel) override;

  private:
    pcap* open(const std::string& iface, std::vector<std::string>& warnings);
    void listen(pcap* handle, ReplyTable& replies, std::chrono::steady_clock::time_point deadline,
                const CancelSignal* cancel, std::vector<std::string>& warnings);

    std::string iface_;
    int snaplen_;
};

#endif
