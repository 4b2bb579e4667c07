#include "core/HostScanner.hpp"
#include "util/Log.hpp"

#include <arpa/inet.h>

#include <sstream>
#include <unordered_set>

namespace netmount::core {

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
  return s.substr(i);
}

static bool is_ipv4(const std::string& s) {
  in_addr in{};
  return ::inet_pton(AF_INET, s.c_str(), &in) == 1;
}

// "445/open/tcp//microsoft-ds///, 139/closed/tcp//netbios-ssn///"
static bool ports_field_has_open(const std::string& field, const std::string& port) {
  std::istringstream ss(field);
  std::string entry;
  while (std::getline(ss, entry, ',')) {
    entry = trim(entry);
    auto s1 = entry.find('/');
    if (s1 == std::string::npos) continue;
    auto s2 = entry.find('/', s1 + 1);
    if (s2 == std::string::npos) continue;
    if (entry.substr(0, s1) == port && entry.substr(s1 + 1, s2 - s1 - 1) == "open") return true;
  }
  return false;
}

auto parse_scan_output(const std::string& text, int port) -> model::HostList {
  model::HostList hosts;
  std::unordered_set<std::string> seen;
  const std::string port_str = std::to_string(port);
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("Host: ", 0) != 0) continue;
    std::istringstream ls(line.substr(6));
    std::string addr;
    if (!(ls >> addr) || !is_ipv4(addr)) continue;

    auto ports_pos = line.find("Ports: ");
    if (ports_pos == std::string::npos) continue;
    std::string field = line.substr(ports_pos + 7);
    auto tab = field.find('\t');
    if (tab != std::string::npos) field.resize(tab);
    if (!ports_field_has_open(field, port_str)) continue;

    if (seen.insert(addr).second) hosts.push_back(model::DiscoveredHost{addr});
  }
  return hosts;
}

HostScanner::HostScanner(util::CommandRunner& runner, int port) : runner_(runner), port_(port) {}

std::vector<std::string> HostScanner::command(const model::NetworkRange& range) const {
  return {"nmap", "-Pn", "-p", std::to_string(port_), "--open", "-oG", "-", range.to_string()};
}

ScanResult HostScanner::scan(const model::NetworkRange& range) {
  ScanResult res;
  auto argv = command(range);
  NM_LOG_INFO("scanning %s for port %d: %s", range.to_string().c_str(), port_, util::format_command(argv).c_str());
  auto out = runner_.run(argv, util::Capture::Stdout);
  if (!out.launched) {
    res.error = "failed to run nmap";
    return res;
  }
  if (out.exit_code != 0) {
    res.error = "nmap exited with status " + std::to_string(out.exit_code);
    return res;
  }
  res.ok = true;
  res.hosts = parse_scan_output(out.output, port_);
  NM_LOG_INFO("found %zu host(s) with port %d open", res.hosts.size(), port_);
  return res;
}

} // namespace netmount::core
