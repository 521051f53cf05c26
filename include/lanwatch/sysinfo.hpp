#ifndef LANWATCH_SYSINFO_HPP
#define LANWATCH_SYSINFO_HPP

#include <string>

bool is_elevated();

// the system's IPv4 interface table in `ip -o -4 addr` format
std::string interface_config_text();

std::string read_text_file(const std::string& path);

#endif
