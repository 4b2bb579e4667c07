#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cstdlib>
#include <string>

namespace netmount::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("NETMOUNT_", 0) == 0) {
    alt = std::string("netmount_") + n.substr(9);
  } else if (n.rfind("netmount_", 0) == 0) {
    alt = std::string("NETMOUNT_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch(...) { return defv; }
}

std::string config_file_path(const std::string& cli_path) {
  if (!cli_path.empty()) return cli_path;
  if (const char* env = getenv_compat("NETMOUNT_CONFIG")) return env;
  return "/etc/netmount/config.toml";
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [paths] ---
  c.paths.mount_root      = resolve_string(toml, have_toml, "paths", "mount_root",      "NETMOUNT_MOUNT_ROOT",      "/mnt");
  c.paths.credentials_dir = resolve_string(toml, have_toml, "paths", "credentials_dir", "NETMOUNT_CREDENTIALS_DIR", "/etc/smbcredentials");
  c.paths.fstab           = resolve_string(toml, have_toml, "paths", "fstab",           "NETMOUNT_FSTAB",           "/etc/fstab");

  // --- [scan] ---
  c.scan.port  = resolve_int(toml, have_toml, "scan", "port", "NETMOUNT_SMB_PORT", 445);
  if (c.scan.port <= 0 || c.scan.port > 65535) c.scan.port = 445;
  c.scan.range = resolve_string(toml, have_toml, "scan", "range", "NETMOUNT_RANGE", "");

  // --- [mount] ---
  c.mount.iocharset = resolve_string(toml, have_toml, "mount", "iocharset", "NETMOUNT_IOCHARSET", "utf8");

  // --- [ui] ---
  c.ui.backend = resolve_string(toml, have_toml, "ui", "backend", "NETMOUNT_UI", "auto");

  // --- [log] ---
  c.log.level = resolve_string(toml, have_toml, "log", "level", "NETMOUNT_LOG_LEVEL", "info");
  c.log.file  = resolve_string(toml, have_toml, "log", "file",  "NETMOUNT_LOG_FILE",  "");

  return c;
}

} // namespace netmount::app
