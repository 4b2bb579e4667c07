#include "minitest.hpp"
#include "fakes.hpp"
#include "core/MountActivator.hpp"

#include <fstream>

using netmount::core::MountActivator;
using netmount::model::ActivationResult;

static netmount::model::MountEntry entry_at(const std::string& local) {
  netmount::model::MountEntry e;
  e.host = "192.168.1.10";
  e.share = "data";
  e.remote_path = "//192.168.1.10/data";
  e.local_path = local;
  return e;
}

// Points /proc/self/mounts at a fixture for the lifetime of the object
struct ProcMounts {
  fs::path root;
  explicit ProcMounts(const std::string& tag, const std::string& mounts) {
    root = make_test_dir(tag);
    fs::create_directories(root / "proc/self");
    std::ofstream(root / "proc/self/mounts") << mounts;
    setenv("NETMOUNT_PROC_ROOT", root.c_str(), 1);
  }
  ~ProcMounts() { unsetenv("NETMOUNT_PROC_ROOT"); }
};

TEST(unit_names_follow_systemd_escaping) {
  ASSERT_EQ(MountActivator::unit_name("/mnt/192.168.1.10/data", ".mount"), std::string("mnt-192.168.1.10-data.mount"));
  ASSERT_EQ(MountActivator::unit_name("/mnt/nas/My Files", ".automount"), std::string("mnt-nas-My\\x20Files.automount"));
  ASSERT_EQ(MountActivator::unit_name("/mnt/nas/a-b", ".mount"), std::string("mnt-nas-a\\x2db.mount"));
  ASSERT_EQ(MountActivator::unit_name("/", ".mount"), std::string("-.mount"));
}

TEST(active_mount_detection_unescapes) {
  std::string mounts =
    "proc /proc proc rw 0 0\n"
    "//nas/My\\040Files /mnt/nas/My\\040Files cifs rw 0 0\n";
  ASSERT_TRUE(netmount::core::is_active_mount(mounts, "/mnt/nas/My Files"));
  ASSERT_FALSE(netmount::core::is_active_mount(mounts, "/mnt/nas"));
}

TEST(automount_trap_is_not_an_active_mount) {
  std::string armed = "systemd-1 /mnt/nas/data autofs rw,relatime,fd=52,pgrp=1,timeout=0,direct 0 0\n";
  ASSERT_FALSE(netmount::core::is_active_mount(armed, "/mnt/nas/data"));
  std::string mounted = armed + "//nas/data /mnt/nas/data cifs rw,relatime 0 0\n";
  ASSERT_TRUE(netmount::core::is_active_mount(mounted, "/mnt/nas/data"));
}

TEST(activate_starts_units_behind_armed_automount) {
  ProcMounts pm("act_autofs", "systemd-1 /mnt/192.168.1.10/data autofs rw 0 0\n");
  FakeRunner runner;
  MountActivator a(runner);
  ASSERT_TRUE(a.activate(entry_at("/mnt/192.168.1.10/data")) == ActivationResult::Started);
  ASSERT_EQ(runner.count("systemctl"), size_t(3));
}

TEST(activate_starts_automount_then_mount) {
  ProcMounts pm("act_start", "proc /proc proc rw 0 0\n");
  FakeRunner runner;
  MountActivator a(runner);
  auto r = a.activate(entry_at("/mnt/192.168.1.10/data"));
  ASSERT_TRUE(r == ActivationResult::Started);
  ASSERT_EQ(runner.calls.size(), size_t(3));
  ASSERT_EQ(runner.calls[0], (std::vector<std::string>{"systemctl", "daemon-reload"}));
  ASSERT_EQ(runner.calls[1], (std::vector<std::string>{"systemctl", "start", "mnt-192.168.1.10-data.automount"}));
  ASSERT_EQ(runner.calls[2], (std::vector<std::string>{"systemctl", "start", "mnt-192.168.1.10-data.mount"}));
}

TEST(activate_failure_is_deferred) {
  ProcMounts pm("act_defer", "");
  FakeRunner runner;
  runner.reply("systemctl", 1, "Failed to reload daemon\n");
  runner.reply("systemctl", 0, "");
  runner.reply("systemctl", 1, "Job for mnt-x.mount failed\n");
  MountActivator a(runner);
  ASSERT_TRUE(a.activate(entry_at("/mnt/x")) == ActivationResult::Deferred);
  ASSERT_EQ(runner.count("systemctl"), size_t(3));
}

TEST(activate_skips_start_when_already_mounted) {
  ProcMounts pm("act_mounted", "//192.168.1.10/data /mnt/192.168.1.10/data cifs rw 0 0\n");
  FakeRunner runner;
  MountActivator a(runner);
  ASSERT_TRUE(a.activate(entry_at("/mnt/192.168.1.10/data")) == ActivationResult::Started);
  ASSERT_EQ(runner.calls.size(), size_t(1));
  ASSERT_EQ(runner.calls[0][1], std::string("daemon-reload"));
}

TEST(activate_dry_run_runs_nothing) {
  FakeRunner runner;
  MountActivator a(runner, true);
  ASSERT_TRUE(a.activate(entry_at("/mnt/x")) == ActivationResult::Deferred);
  ASSERT_TRUE(runner.calls.empty());
}
