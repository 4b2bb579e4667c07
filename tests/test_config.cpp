#include "minitest.hpp"
#include "fakes.hpp"
#include "app/Config.hpp"

#include <cstdlib>
#include <fstream>

static void clear_env() {
  for (const char* n : {"NETMOUNT_MOUNT_ROOT", "NETMOUNT_CREDENTIALS_DIR", "NETMOUNT_FSTAB", "NETMOUNT_SMB_PORT",
                        "NETMOUNT_RANGE", "NETMOUNT_IOCHARSET", "NETMOUNT_UI", "NETMOUNT_LOG_LEVEL",
                        "NETMOUNT_LOG_FILE", "NETMOUNT_CONFIG", "netmount_FSTAB"})
    unsetenv(n);
}

TEST(config_defaults) {
  clear_env();
  auto c = netmount::app::load_config("/nonexistent/netmount.toml");
  ASSERT_EQ(c.paths.mount_root, std::string("/mnt"));
  ASSERT_EQ(c.paths.credentials_dir, std::string("/etc/smbcredentials"));
  ASSERT_EQ(c.paths.fstab, std::string("/etc/fstab"));
  ASSERT_EQ(c.scan.port, 445);
  ASSERT_EQ(c.scan.range, std::string(""));
  ASSERT_EQ(c.mount.iocharset, std::string("utf8"));
  ASSERT_EQ(c.ui.backend, std::string("auto"));
  ASSERT_EQ(c.log.level, std::string("info"));
}

TEST(config_toml_beats_env_beats_default) {
  clear_env();
  auto dir = make_test_dir("config");
  std::ofstream(dir / "config.toml") <<
    "[paths]\n"
    "mount_root = \"/srv/smb\"\n"
    "[scan]\n"
    "port = 1445\n";
  setenv("NETMOUNT_MOUNT_ROOT", "/env/mnt", 1);
  setenv("NETMOUNT_FSTAB", "/env/fstab", 1);
  setenv("NETMOUNT_UI", "plain", 1);
  auto c = netmount::app::load_config((dir / "config.toml").string());
  clear_env();
  ASSERT_EQ(c.paths.mount_root, std::string("/srv/smb"));
  ASSERT_EQ(c.paths.fstab, std::string("/env/fstab"));
  ASSERT_EQ(c.ui.backend, std::string("plain"));
  ASSERT_EQ(c.scan.port, 1445);
  ASSERT_EQ(c.paths.credentials_dir, std::string("/etc/smbcredentials"));
}

TEST(config_lowercase_prefix_env_and_bad_port) {
  clear_env();
  // only the prefix case varies; the key keeps its upper-case spelling
  setenv("netmount_FSTAB", "/lower/fstab", 1);
  setenv("NETMOUNT_SMB_PORT", "70000", 1);
  auto c = netmount::app::load_config("");
  clear_env();
  ASSERT_EQ(c.paths.fstab, std::string("/lower/fstab"));
  ASSERT_EQ(c.scan.port, 445);
}

TEST(config_file_location) {
  clear_env();
  ASSERT_EQ(netmount::app::config_file_path("/cli.toml"), std::string("/cli.toml"));
  ASSERT_EQ(netmount::app::config_file_path(""), std::string("/etc/netmount/config.toml"));
  setenv("NETMOUNT_CONFIG", "/env.toml", 1);
  ASSERT_EQ(netmount::app::config_file_path(""), std::string("/env.toml"));
  clear_env();
}
