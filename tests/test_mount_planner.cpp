#include "minitest.hpp"
#include "fakes.hpp"
#include "core/MountPlanner.hpp"
#include "util/PathEscape.hpp"

#include <algorithm>
#include <fstream>

using netmount::model::MergeOutcome;

static netmount::core::PlannerOptions opts_in(const fs::path& root) {
  netmount::core::PlannerOptions o;
  o.mount_root = root / "mnt";
  o.fstab = root / "fstab";
  return o;
}

static size_t count_lines_containing(const std::string& text, const std::string& needle) {
  size_t n = 0;
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) if (line.find(needle) != std::string::npos) ++n;
  return n;
}

TEST(sanitize_removes_separators) {
  using netmount::util::sanitize_component;
  ASSERT_EQ(sanitize_component("a/b:c"), std::string("a_b_c"));
  ASSERT_EQ(sanitize_component("data"), std::string("data"));
  ASSERT_EQ(sanitize_component(sanitize_component("x:/y")), sanitize_component("x:/y"));
  auto s = sanitize_component("::://");
  ASSERT_TRUE(s.find('/') == std::string::npos && s.find(':') == std::string::npos);
}

TEST(plan_builds_path_and_options) {
  netmount::core::PlannerOptions o;
  netmount::core::MountPlanner planner(o);
  netmount::model::CredentialFileRef cred{"192.168.1.10", "/etc/smbcredentials/192.168.1.10"};
  auto e = planner.plan("192.168.1.10", "data", cred, 1000, 1000);
  ASSERT_EQ(e.local_path, std::string("/mnt/192.168.1.10/data"));
  ASSERT_EQ(e.remote_path, std::string("//192.168.1.10/data"));
  std::vector<std::string> expected{
    "credentials=/etc/smbcredentials/192.168.1.10",
    "noauto",
    "x-systemd.automount",
    "_netdev",
    "x-systemd.requires=network-online.target",
    "x-systemd.after=network-online.target",
    "iocharset=utf8",
    "uid=1000",
    "gid=1000",
  };
  ASSERT_EQ(e.options, expected);
  ASSERT_EQ(planner.format_record(e),
            std::string("//192.168.1.10/data /mnt/192.168.1.10/data cifs "
                        "credentials=/etc/smbcredentials/192.168.1.10,noauto,x-systemd.automount,_netdev,"
                        "x-systemd.requires=network-online.target,x-systemd.after=network-online.target,"
                        "iocharset=utf8,uid=1000,gid=1000 0 0"));
}

TEST(plan_root_owner_has_no_uid_option) {
  netmount::core::MountPlanner planner(netmount::core::PlannerOptions{});
  auto e = planner.plan("nas", "media", {"nas", "/c/nas"}, 0, 0);
  for (const auto& o : e.options) {
    ASSERT_TRUE(o.rfind("uid=", 0) != 0);
    ASSERT_TRUE(o.rfind("gid=", 0) != 0);
  }
}

TEST(share_names_with_spaces_are_escaped) {
  netmount::core::MountPlanner planner(netmount::core::PlannerOptions{});
  auto e = planner.plan("nas", "My Files", {"nas", "/c/nas"}, 0, 0);
  ASSERT_EQ(e.local_path, std::string("/mnt/nas/My Files"));
  auto line = planner.format_record(e);
  ASSERT_EQ(line.rfind("//nas/My\\040Files /mnt/nas/My\\040Files cifs ", 0), size_t(0));
}

TEST(merge_appends_once) {
  auto root = make_test_dir("planner_idem");
  std::ofstream(root / "fstab") << "# static file system information\nUUID=abc / ext4 defaults 0 1";  // no trailing newline
  netmount::core::MountPlanner planner(opts_in(root));
  auto e = planner.plan("192.168.1.10", "data", {"192.168.1.10", "/c/192.168.1.10"}, 1000, 1000);

  auto first = planner.merge(e);
  ASSERT_TRUE(first.outcome == MergeOutcome::Appended);
  ASSERT_TRUE(fs::is_directory(e.local_path));
  auto second = planner.merge(e);
  ASSERT_TRUE(second.outcome == MergeOutcome::AlreadyExists);

  auto table = slurp(root / "fstab");
  ASSERT_EQ(count_lines_containing(table, "//192.168.1.10/data "), size_t(1));
  ASSERT_TRUE(table.find("UUID=abc / ext4 defaults 0 1\n//192.168.1.10/data ") != std::string::npos);
  ASSERT_EQ(table.back(), '\n');

  // backup holds the original table
  ASSERT_EQ(slurp(root / "fstab.netmount.bak"), std::string("# static file system information\nUUID=abc / ext4 defaults 0 1"));
}

TEST(merge_ignores_commented_entries) {
  auto root = make_test_dir("planner_comment");
  std::ofstream(root / "fstab") << "#//nas/data /mnt/nas/data cifs defaults 0 0\n";
  netmount::core::MountPlanner planner(opts_in(root));
  auto e = planner.plan("nas", "data", {"nas", "/c/nas"}, 0, 0);
  ASSERT_TRUE(planner.merge(e).outcome == MergeOutcome::Appended);
}

TEST(merge_matches_whole_remote_field) {
  auto root = make_test_dir("planner_prefix");
  std::ofstream(root / "fstab") << "//nas/data2 /srv/other cifs defaults 0 0\n";
  netmount::core::MountPlanner planner(opts_in(root));
  auto e = planner.plan("nas", "data", {"nas", "/c/nas"}, 0, 0);
  ASSERT_TRUE(planner.merge(e).outcome == MergeOutcome::Appended);
}

TEST(merge_rejects_taken_mount_point) {
  auto root = make_test_dir("planner_conflict");
  netmount::core::MountPlanner planner(opts_in(root));
  auto local = (root / "mnt" / "nas" / "data").string();
  std::ofstream(root / "fstab") << "//othernas/stuff " << netmount::util::escape_mount_field(local) << " cifs defaults 0 0\n";
  auto before = slurp(root / "fstab");
  auto e = planner.plan("nas", "data", {"nas", "/c/nas"}, 0, 0);
  auto res = planner.merge(e);
  ASSERT_TRUE(res.outcome == MergeOutcome::Conflict);
  ASSERT_EQ(res.detail, std::string("//othernas/stuff"));
  ASSERT_EQ(slurp(root / "fstab"), before);
}

TEST(merge_creates_missing_table) {
  auto root = make_test_dir("planner_missing");
  netmount::core::MountPlanner planner(opts_in(root));
  auto e = planner.plan("nas", "data", {"nas", "/c/nas"}, 0, 0);
  ASSERT_TRUE(planner.merge(e).outcome == MergeOutcome::Appended);
  ASSERT_EQ(slurp(root / "fstab"), planner.format_record(e) + "\n");
  ASSERT_FALSE(fs::exists(root / "fstab.netmount.bak"));
}

TEST(merge_dry_run_writes_nothing) {
  auto root = make_test_dir("planner_dry");
  std::ofstream(root / "fstab") << "UUID=abc / ext4 defaults 0 1\n";
  auto o = opts_in(root);
  o.dry_run = true;
  netmount::core::MountPlanner planner(o);
  auto e = planner.plan("nas", "data", {"nas", "/c/nas"}, 0, 0);
  auto res = planner.merge(e);
  ASSERT_TRUE(res.outcome == MergeOutcome::DryRun);
  ASSERT_EQ(res.line, planner.format_record(e));
  ASSERT_EQ(slurp(root / "fstab"), std::string("UUID=abc / ext4 defaults 0 1\n"));
  ASSERT_FALSE(fs::exists(e.local_path));
  ASSERT_FALSE(fs::exists(root / "fstab.netmount.bak"));
}

TEST(merge_with_spaces_is_idempotent) {
  auto root = make_test_dir("planner_spaces");
  std::ofstream(root / "fstab") << "UUID=abc / ext4 defaults 0 1\n";
  netmount::core::MountPlanner planner(opts_in(root));
  auto e = planner.plan("my nas", "My Files", {"my nas", "/c/my nas"}, 0, 0);

  ASSERT_TRUE(planner.merge(e).outcome == MergeOutcome::Appended);
  ASSERT_TRUE(planner.merge(e).outcome == MergeOutcome::AlreadyExists);

  auto table = slurp(root / "fstab");
  ASSERT_EQ(count_lines_containing(table, "//my\\040nas/My\\040Files "), size_t(1));
  ASSERT_EQ(count_lines_containing(table, "//my nas"), size_t(0));
  ASSERT_TRUE(table.find("/my\\040nas/My\\040Files cifs ") != std::string::npos);
}
