#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace netmount::model {

// IPv4 CIDR block. address is in host byte order.
struct NetworkRange {
  uint32_t address{};
  int prefix{};

  // e.g. "192.168.1.0/24"
  [[nodiscard]] std::string to_string() const {
    return std::to_string((address >> 24) & 0xFF) + '.' + std::to_string((address >> 16) & 0xFF) + '.' +
           std::to_string((address >> 8) & 0xFF) + '.' + std::to_string(address & 0xFF) + '/' +
           std::to_string(prefix);
  }
};

// IPv4 address assigned to a local interface.
struct InterfaceAddress {
  std::string iface;    // e.g. eth0
  uint32_t address{};   // host byte order
  int prefix{};
};

// Host confirmed to expose the SMB port.
struct DiscoveredHost {
  std::string address;  // dotted quad
};

using HostList = std::vector<DiscoveredHost>;

} // namespace netmount::model
