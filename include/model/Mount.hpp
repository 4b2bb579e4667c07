#pragma once
#include <string>
#include <sys/types.h>
#include <vector>

namespace netmount::model {

struct MountEntry {
  std::string host;
  std::string share;
  std::string remote_path;     // //host/share (unescaped)
  std::string local_path;      // <mount_root>/<host>/<sanitized share> (unescaped)
  std::string credential_file;
  uid_t owner_uid{0};
  gid_t owner_gid{0};
  std::vector<std::string> options;
};

enum class MergeOutcome {
  Appended,       // one new line written to the table
  AlreadyExists,  // a line with the same remote path is present
  Conflict,       // local path already used by a different remote path
  Failed,         // table or mount directory could not be written
  DryRun          // line computed but not written
};

struct MergeResult {
  MergeOutcome outcome{MergeOutcome::Failed};
  std::string line;     // the record appended (or that would be appended)
  std::string detail;   // conflicting remote path, or error text
};

enum class ActivationResult { Started, Deferred };

} // namespace netmount::model
