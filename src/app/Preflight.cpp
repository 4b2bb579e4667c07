#include "app/Preflight.hpp"

namespace netmount::app {

PreflightReport check_preflight(uid_t euid, const ToolLookup& find) {
  PreflightReport r;
  if (euid != 0) r.errors.push_back("Please run as root (needed for /etc/fstab, credential files and systemctl).");

  struct Tool { const char* name; const char* package; };
  static constexpr Tool required[] = {
    {"nmap", "nmap"},
    {"smbclient", "smbclient"},
    {"systemctl", "systemd"},
  };
  for (const auto& t : required) {
    if (find(t.name).empty())
      r.errors.push_back(std::string("Required tool '") + t.name + "' not found (install package " + t.package + ").");
  }
  if (find("mount.cifs").empty())
    r.warnings.push_back("mount.cifs not found (package cifs-utils); mounts will fail until it is installed.");
  return r;
}

} // namespace netmount::app
