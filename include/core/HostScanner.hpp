#pragma once

#include "model/Network.hpp"
#include "util/Exec.hpp"

#include <string>
#include <vector>

namespace netmount::core {

// Parse nmap grepable output (-oG -). Only "Host: <ipv4> ... Ports: ..."
// lines that list <port>/open/... contribute an address. Addresses are
// deduplicated in first-seen order.
[[nodiscard]] auto parse_scan_output(const std::string& text, int port) -> model::HostList;

struct ScanResult {
  bool ok{false};          // scanner ran; an empty host list is still ok
  model::HostList hosts;
  std::string error;
};

class HostScanner {
public:
  HostScanner(util::CommandRunner& runner, int port);

  // Single pass over the range, hosts assumed up so that hosts dropping
  // ICMP are still probed on the service port.
  [[nodiscard]] ScanResult scan(const model::NetworkRange& range);

  [[nodiscard]] std::vector<std::string> command(const model::NetworkRange& range) const;

private:
  util::CommandRunner& runner_;
  int port_;
};

} // namespace netmount::core
