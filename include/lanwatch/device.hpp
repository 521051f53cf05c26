#ifndef LANWATCH_DEVICE_HPP
#define LANWATCH_DEVICE_HPP

#include <lanwatch/net.hpp>

#include <optional>
#include <string>
#include <vector>

struct IPv4Subnet {
    IPv4 addr;
    IPv4 mask;
};

class Device {
  private:
    int id_;

  public:
    explicit Device(int id);
    explicit Device(const std::string& name);
    explicit Device(const char* name);

    // every interface that is up, in kernel index order
    static std::vector<Device> all();

    // first interface holding an IPv4 address inside range
    static std::optional<Device> for_range(const NetworkRange& range);

    int id() const;
    std::string name() const;
    bool exists() const;

    std::vector<IPv4Subnet> ipv4_addrs() const;
    std::optional<MAC> mac_addr() const;
};

#endif
