#include "core/RangeResolver.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

#include <climits>
#include <sstream>

namespace netmount::core {

static constexpr int kMaxAttempts = 3;

static uint32_t prefix_mask(int prefix) {
  if (prefix <= 0) return 0;
  if (prefix >= 32) return 0xFFFFFFFFu;
  return 0xFFFFFFFFu << (32 - prefix);
}

static int mask_to_prefix(uint32_t mask) {
  int n = 0;
  while (mask & 0x80000000u) { ++n; mask <<= 1; }
  return n;
}

auto network_of(uint32_t address, int prefix) -> model::NetworkRange {
  return model::NetworkRange{address & prefix_mask(prefix), prefix};
}

auto parse_cidr(const std::string& s) -> std::optional<model::NetworkRange> {
  auto slash = s.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= s.size()) return std::nullopt;
  std::string addr = s.substr(0, slash);
  std::string pfx = s.substr(slash + 1);
  if (pfx.size() > 2) return std::nullopt;
  for (char c : pfx) if (c < '0' || c > '9') return std::nullopt;
  int prefix = std::stoi(pfx);
  if (prefix < 0 || prefix > 32) return std::nullopt;
  in_addr in{};
  if (::inet_pton(AF_INET, addr.c_str(), &in) != 1) return std::nullopt;
  return network_of(ntohl(in.s_addr), prefix);
}

auto parse_default_route_iface(const std::string& route_text) -> std::optional<std::string> {
  std::istringstream ss(route_text);
  std::string line;
  std::optional<std::string> best;
  long best_metric = LONG_MAX;
  int line_no = 0;
  while (std::getline(ss, line)) {
    if (++line_no == 1) continue; // header
    std::istringstream ls(line);
    std::string iface, dest, gw, flags, refcnt, use, metric, mask;
    if (!(ls >> iface >> dest >> gw >> flags >> refcnt >> use >> metric >> mask)) continue;
    if (dest != "00000000" || mask != "00000000") continue;
    unsigned long fl = 0;
    long m = 0;
    try {
      fl = std::stoul(flags, nullptr, 16);
      m = std::stol(metric);
    } catch (...) {
      continue;
    }
    if ((fl & 0x1UL) == 0) continue; // RTF_UP
    if (m < best_metric) { best_metric = m; best = iface; }
  }
  return best;
}

bool is_global_ipv4(uint32_t address) {
  const uint32_t first = address >> 24;
  if (address == 0) return false;
  if (first == 127) return false;                     // loopback
  if ((address & 0xFFFF0000u) == 0xA9FE0000u) return false; // 169.254/16
  if (first >= 224) return false;                     // multicast, reserved
  return true;
}

auto pick_range(const std::optional<std::string>& default_iface,
                const std::vector<model::InterfaceAddress>& addrs) -> std::optional<model::NetworkRange> {
  if (default_iface) {
    for (const auto& a : addrs) {
      if (a.iface == *default_iface && is_global_ipv4(a.address)) return network_of(a.address, a.prefix);
    }
  }
  for (const auto& a : addrs) {
    if (is_global_ipv4(a.address)) return network_of(a.address, a.prefix);
  }
  return std::nullopt;
}

auto list_ipv4_addresses() -> std::vector<model::InterfaceAddress> {
  std::vector<model::InterfaceAddress> out;
  ifaddrs* head = nullptr;
  if (::getifaddrs(&head) != 0) return out;
  for (ifaddrs* it = head; it; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    uint32_t mask = 0;
    if (it->ifa_netmask) mask = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr);
    out.push_back(model::InterfaceAddress{it->ifa_name ? it->ifa_name : "", ntohl(sin->sin_addr.s_addr),
                                          mask_to_prefix(mask)});
  }
  ::freeifaddrs(head);
  return out;
}

RangeResolver::RangeResolver(ui::Prompter& prompter, AddressSource addresses)
    : prompter_(prompter), addresses_(std::move(addresses)) {}

auto RangeResolver::detect() const -> std::optional<model::NetworkRange> {
  std::optional<std::string> iface;
  if (auto route = util::read_file_string("/proc/net/route")) iface = parse_default_route_iface(*route);
  if (iface) NM_LOG_DEBUG("default route via %s", iface->c_str());
  return pick_range(iface, addresses_ ? addresses_() : std::vector<model::InterfaceAddress>{});
}

auto RangeResolver::resolve(const std::string& hint) -> std::optional<model::NetworkRange> {
  std::string def;
  if (!hint.empty()) {
    if (auto r = parse_cidr(hint)) def = r->to_string();
    else NM_LOG_WARN("ignoring invalid range hint '%s'", hint.c_str());
  }
  if (def.empty()) {
    if (auto r = detect()) {
      def = r->to_string();
      NM_LOG_INFO("detected network range %s", def.c_str());
    } else {
      NM_LOG_WARN("could not detect the local network range, manual input required");
    }
  }

  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    auto answer = prompter_.prompt_text("Network range to scan (CIDR)", def);
    if (!answer) return std::nullopt;
    if (auto r = parse_cidr(*answer)) return r;
    NM_LOG_WARN("'%s' is not a valid CIDR range", answer->c_str());
    prompter_.message("Invalid range", "'" + *answer + "' is not a valid CIDR range (e.g. 192.168.1.0/24).");
  }
  return std::nullopt;
}

} // namespace netmount::core
