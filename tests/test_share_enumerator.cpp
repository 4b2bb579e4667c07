#include "minitest.hpp"
#include "fakes.hpp"
#include "core/ShareEnumerator.hpp"

static const char* kListing =
  "\n"
  "\tSharename       Type      Comment\n"
  "\t---------       ----      -------\n"
  "\tdata            Disk      Team data\n"
  "\tprint$          Disk      Printer Drivers\n"
  "\tIPC$            IPC       IPC Service (Samba 4.19)\n"
  "\tlaser           Printer   Office printer\n"
  "\tbackups         Disk      \n"
  "\tdata            Disk      duplicate row\n"
  "\n"
  "\tServer               Comment\n"
  "\t---------            -------\n"
  "\tNAS                  Samba 4.19\n"
  "\n"
  "\tWorkgroup            Master\n"
  "\t---------            -------\n"
  "\tWORKGROUP            NAS\n";

TEST(reserved_shares) {
  using netmount::core::is_reserved_share;
  ASSERT_TRUE(is_reserved_share("IPC$", "IPC"));
  ASSERT_TRUE(is_reserved_share("ADMIN$", "Disk"));
  ASSERT_TRUE(is_reserved_share("C$", "Disk"));
  ASSERT_TRUE(is_reserved_share("laser", "Printer"));
  ASSERT_TRUE(is_reserved_share("", "Disk"));
  ASSERT_FALSE(is_reserved_share("data", "Disk"));
}

TEST(listing_keeps_ordinary_shares_in_order) {
  auto shares = netmount::core::parse_share_listing("192.168.1.10", kListing);
  ASSERT_EQ(shares.size(), size_t(2));
  ASSERT_EQ(shares[0].name, std::string("data"));
  ASSERT_EQ(shares[1].name, std::string("backups"));
  ASSERT_EQ(shares[0].host, std::string("192.168.1.10"));
}

TEST(listing_without_header_is_empty) {
  auto shares = netmount::core::parse_share_listing("h", "session setup failed: NT_STATUS_LOGON_FAILURE\n");
  ASSERT_TRUE(shares.empty());
  auto only_admin = netmount::core::parse_share_listing("h",
    "\tSharename       Type      Comment\n"
    "\t---------       ----      -------\n"
    "\tIPC$            IPC       IPC Service\n"
    "\n");
  ASSERT_TRUE(only_admin.empty());
}

TEST(enumerator_passes_credentials_by_file) {
  netmount::model::CredentialFileRef cred{"192.168.1.10", "/etc/smbcredentials/192.168.1.10"};
  auto cmd = netmount::core::ShareEnumerator::command("192.168.1.10", cred);
  std::vector<std::string> expected{"smbclient", "-L", "//192.168.1.10", "-A", "/etc/smbcredentials/192.168.1.10"};
  ASSERT_EQ(cmd, expected);
}

TEST(enumerator_keeps_raw_output_on_failure) {
  FakeRunner runner;
  runner.reply("smbclient", 1, "session setup failed: NT_STATUS_LOGON_FAILURE\n");
  runner.reply("smbclient", 0, kListing);
  runner.reply("smbclient", -1, "", false);
  netmount::core::ShareEnumerator e(runner);
  netmount::model::CredentialFileRef cred{"h", "/tmp/cred"};

  auto bad = e.list_shares("h", cred);
  ASSERT_TRUE(bad.shares.empty());
  ASSERT_FALSE(bad.query_ok);
  ASSERT_TRUE(bad.raw_output.find("NT_STATUS_LOGON_FAILURE") != std::string::npos);

  auto good = e.list_shares("h", cred);
  ASSERT_TRUE(good.query_ok);
  ASSERT_EQ(good.shares.size(), size_t(2));

  auto missing = e.list_shares("h", cred);
  ASSERT_TRUE(missing.shares.empty());
  ASSERT_EQ(missing.raw_output, std::string("smbclient could not be started"));
}

TEST(listing_takes_first_token_of_spaced_name) {
  auto shares = netmount::core::parse_share_listing("nas",
    "\tSharename       Type      Comment\n"
    "\t---------       ----      -------\n"
    "\tMy Files        Disk      \n"
    "\n");
  ASSERT_EQ(shares.size(), size_t(1));
  ASSERT_EQ(shares[0].name, std::string("My"));
}
