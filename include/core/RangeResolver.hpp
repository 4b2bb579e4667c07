#pragma once

#include "model/Network.hpp"
#include "ui/Prompter.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace netmount::core {

// "a.b.c.d/p" -> range normalized to its network address. Rejects a
// missing or out-of-range prefix and anything inet_pton rejects.
[[nodiscard]] auto parse_cidr(const std::string& s) -> std::optional<model::NetworkRange>;

[[nodiscard]] auto network_of(uint32_t address, int prefix) -> model::NetworkRange;

// Interface carrying the default IPv4 route in /proc/net/route text
// (lowest metric wins). std::nullopt when there is no default route.
[[nodiscard]] auto parse_default_route_iface(const std::string& route_text) -> std::optional<std::string>;

// Not loopback, link-local, multicast or unspecified.
[[nodiscard]] bool is_global_ipv4(uint32_t address);

// Detection policy: the default-route interface's address first, then the
// first global address on any interface.
[[nodiscard]] auto pick_range(const std::optional<std::string>& default_iface,
                              const std::vector<model::InterfaceAddress>& addrs)
    -> std::optional<model::NetworkRange>;

// IPv4 addresses of all interfaces via getifaddrs(3).
[[nodiscard]] auto list_ipv4_addresses() -> std::vector<model::InterfaceAddress>;

class RangeResolver {
public:
  using AddressSource = std::function<std::vector<model::InterfaceAddress>()>;

  explicit RangeResolver(ui::Prompter& prompter, AddressSource addresses = list_ipv4_addresses);

  // Detect, then let the operator confirm or override. hint (from the
  // command line or config) replaces the detected value as the default.
  // std::nullopt means no usable range: cancelled or three invalid inputs.
  [[nodiscard]] auto resolve(const std::string& hint = "") -> std::optional<model::NetworkRange>;

  [[nodiscard]] auto detect() const -> std::optional<model::NetworkRange>;

private:
  ui::Prompter& prompter_;
  AddressSource addresses_;
};

} // namespace netmount::core
