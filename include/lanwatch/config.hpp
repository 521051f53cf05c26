#ifndef LANWATCH_CONFIG_HPP
#define LANWATCH_CONFIG_HPP

#include <string>

struct Config {
    std::string iface;
    std::string ifconfig_file;
    std::string range;
    float probe_timeout{2.0f};
    float lookup_timeout{0.5f};
    int lookup_workers{32};
    float ble_timeout{5.0f};
    int hci_dev{-1};
    int snaplen{128};
    bool ble{true};
    bool sequential{false};
};

#endif
