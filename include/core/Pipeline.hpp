#pragma once

#include "core/RangeResolver.hpp"
#include "ui/Prompter.hpp"
#include "util/Exec.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <sys/types.h>
#include <vector>

namespace netmount::core {

class CredentialStore;
class MountPlanner;
class MountActivator;

struct PipelineOptions {
  std::string mount_root{"/mnt"};
  std::string credentials_dir{"/etc/smbcredentials"};
  std::string fstab{"/etc/fstab"};
  int port{445};
  std::string iocharset{"utf8"};
  bool dry_run{false};

  // Pre-filled answers (from $SUDO_USER / $SUDO_UID / $SUDO_GID)
  std::string default_user;
  uid_t default_uid{0};
  gid_t default_gid{0};

  // Account owning credential files; the effective user in production
  uid_t credential_uid{0};
  gid_t credential_gid{0};
};

enum class ShareStatus {
  Started,   // mounted now or already mounted
  Deferred,  // persisted; systemd mounts on first access or next boot
  Existing,  // record was already present, nothing written
  Planned,   // dry run: nothing written
  Conflict,  // local path taken by another remote
  Failed     // table or directory could not be written
};

[[nodiscard]] const char* to_string(ShareStatus s);

struct ShareResult {
  std::string share;
  std::string local_path;
  ShareStatus status{ShareStatus::Failed};
  std::string detail;
};

struct HostResult {
  std::string host;
  std::string credential_file;  // empty if never written
  std::vector<ShareResult> shares;
  std::string failure;          // per-host soft failure, empty if none
  bool cancelled{false};        // operator backed out; not a failure
};

struct RunSummary {
  bool fatal{false};
  std::string fatal_message;
  std::string range;
  std::size_t hosts_found{0};
  std::vector<HostResult> hosts;

  [[nodiscard]] std::size_t soft_failures() const;
};

// Discover -> select -> authenticate -> enumerate -> persist -> activate.
// Hosts are processed one at a time; a soft failure on one host or share
// is recorded and the run moves on.
class Pipeline {
public:
  Pipeline(PipelineOptions opts, util::CommandRunner& runner, ui::Prompter& prompter,
           RangeResolver::AddressSource addresses = list_ipv4_addresses);

  [[nodiscard]] RunSummary run(const std::string& range_hint);

private:
  void process_host(const std::string& host, CredentialStore& store, MountPlanner& planner,
                    MountActivator& activator, HostResult& out);
  [[nodiscard]] bool prompt_owner(const std::string& host, uid_t& uid, gid_t& gid, bool& cancelled);

  PipelineOptions opts_;
  util::CommandRunner& runner_;
  ui::Prompter& prompter_;
  RangeResolver::AddressSource addresses_;
};

void print_summary(const RunSummary& summary, std::ostream& out);

} // namespace netmount::core
