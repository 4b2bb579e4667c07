#pragma once

#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace netmount::app {

struct PreflightReport {
  std::vector<std::string> errors;    // fatal: the run must not start
  std::vector<std::string> warnings;

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

using ToolLookup = std::function<std::string(const std::string&)>;

// Root privilege plus nmap, smbclient and systemctl are required;
// a missing mount.cifs is only a warning since the mount is deferred.
[[nodiscard]] PreflightReport check_preflight(uid_t euid, const ToolLookup& find);

} // namespace netmount::app
