#pragma once

#include <string>

namespace netmount::app {

struct Config {
  struct Paths {
    std::string mount_root;
    std::string credentials_dir;
    std::string fstab;
  } paths;

  struct Scan {
    int port{445};
    std::string range;  // empty: auto-detect
  } scan;

  struct Mount {
    std::string iocharset;
  } mount;

  struct UI {
    std::string backend;  // auto | whiptail | dialog | plain
  } ui;

  struct Log {
    std::string level;
    std::string file;
  } log;
};

// Each value resolves TOML -> environment -> compiled default.
// A missing or unreadable file just means "no TOML layer".
[[nodiscard]] Config load_config(const std::string& path);

// --config value if given, else $NETMOUNT_CONFIG, else /etc/netmount/config.toml
[[nodiscard]] std::string config_file_path(const std::string& cli_path);

// Environment variable helpers. NETMOUNT_X and netmount_X are both accepted.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace netmount::app
