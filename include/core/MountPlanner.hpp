#pragma once

#include "model/Mount.hpp"
#include "model/Share.hpp"

#include <filesystem>
#include <string>
#include <sys/types.h>

namespace netmount::core {

struct PlannerOptions {
  std::filesystem::path mount_root{"/mnt"};
  std::filesystem::path fstab{"/etc/fstab"};
  std::string fstype{"cifs"};
  std::string iocharset{"utf8"};
  bool dry_run{false};
};

class MountPlanner {
public:
  explicit MountPlanner(PlannerOptions opts);

  // Pure: derives the local path and option list. uid=/gid= options are
  // added only for a non-root owner.
  [[nodiscard]] model::MountEntry plan(const std::string& host, const std::string& share,
                                       const model::CredentialFileRef& cred, uid_t owner_uid,
                                       gid_t owner_gid) const;

  // fstab line for entry, every field escaped.
  [[nodiscard]] std::string format_record(const model::MountEntry& entry) const;

  // Idempotent append to the mount table, keyed on the remote-path field.
  // Not safe against concurrent writers of the same table.
  [[nodiscard]] model::MergeResult merge(const model::MountEntry& entry);

private:
  [[nodiscard]] bool backup_table_once();

  PlannerOptions opts_;
  bool backed_up_{false};
};

} // namespace netmount::core
