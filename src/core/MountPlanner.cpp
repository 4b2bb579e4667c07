#include "core/MountPlanner.hpp"
#include "util/Log.hpp"
#include "util/PathEscape.hpp"
#include "util/Procfs.hpp"

#include <fstream>
#include <sstream>

namespace netmount::core {

MountPlanner::MountPlanner(PlannerOptions opts) : opts_(std::move(opts)) {}

model::MountEntry MountPlanner::plan(const std::string& host, const std::string& share,
                                     const model::CredentialFileRef& cred, uid_t owner_uid,
                                     gid_t owner_gid) const {
  model::MountEntry e;
  e.host = host;
  e.share = share;
  e.remote_path = "//" + host + "/" + share;
  e.local_path = (opts_.mount_root / util::sanitize_component(host) / util::sanitize_component(share)).string();
  e.credential_file = cred.path;
  e.owner_uid = owner_uid;
  e.owner_gid = owner_gid;

  e.options = {
    "credentials=" + cred.path,
    "noauto",
    "x-systemd.automount",
    "_netdev",
    "x-systemd.requires=network-online.target",
    "x-systemd.after=network-online.target",
    "iocharset=" + opts_.iocharset,
  };
  if (owner_uid != 0 || owner_gid != 0) {
    e.options.push_back("uid=" + std::to_string(owner_uid));
    e.options.push_back("gid=" + std::to_string(owner_gid));
  }
  return e;
}

std::string MountPlanner::format_record(const model::MountEntry& entry) const {
  std::string opts;
  for (const auto& o : entry.options) {
    if (!opts.empty()) opts.push_back(',');
    opts += o;
  }
  return util::escape_mount_field(entry.remote_path) + ' ' + util::escape_mount_field(entry.local_path) + ' ' +
         opts_.fstype + ' ' + util::escape_mount_field(opts) + " 0 0";
}

bool MountPlanner::backup_table_once() {
  if (backed_up_) return true;
  std::error_code ec;
  if (!std::filesystem::exists(opts_.fstab, ec)) {
    backed_up_ = true;
    return true;
  }
  auto backup = opts_.fstab;
  backup += ".netmount.bak";
  std::filesystem::copy_file(opts_.fstab, backup, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    NM_LOG_ERROR("failed to back up %s: %s", opts_.fstab.c_str(), ec.message().c_str());
    return false;
  }
  NM_LOG_INFO("backed up %s to %s", opts_.fstab.c_str(), backup.c_str());
  backed_up_ = true;
  return true;
}

model::MergeResult MountPlanner::merge(const model::MountEntry& entry) {
  model::MergeResult res;
  res.line = format_record(entry);
  const std::string remote = util::escape_mount_field(entry.remote_path);
  const std::string local = util::escape_mount_field(entry.local_path);

  std::string table;
  std::error_code ec;
  if (std::filesystem::exists(opts_.fstab, ec)) {
    auto txt = util::read_file_string(opts_.fstab.string());
    if (!txt) {
      res.detail = "cannot read " + opts_.fstab.string();
      NM_LOG_ERROR("%s", res.detail.c_str());
      return res;
    }
    table = std::move(*txt);
  }

  std::istringstream ss(table);
  std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    std::string f_remote, f_local;
    if (!(ls >> f_remote) || f_remote[0] == '#') continue;
    ls >> f_local;
    if (f_remote == remote) {
      res.outcome = model::MergeOutcome::AlreadyExists;
      NM_LOG_INFO("entry for %s already exists in %s", entry.remote_path.c_str(), opts_.fstab.c_str());
      return res;
    }
    if (f_local == local) {
      res.outcome = model::MergeOutcome::Conflict;
      res.detail = util::unescape_mount_field(f_remote);
      NM_LOG_WARN("%s is already the mount point of %s, not adding %s", entry.local_path.c_str(),
                  res.detail.c_str(), entry.remote_path.c_str());
      return res;
    }
  }

  if (opts_.dry_run) {
    res.outcome = model::MergeOutcome::DryRun;
    NM_LOG_INFO("[dry-run] would append to %s: %s", opts_.fstab.c_str(), res.line.c_str());
    return res;
  }

  std::filesystem::create_directories(entry.local_path, ec);
  if (ec) {
    res.detail = "cannot create " + entry.local_path + ": " + ec.message();
    NM_LOG_ERROR("%s", res.detail.c_str());
    return res;
  }
  if (!backup_table_once()) {
    res.detail = "cannot back up " + opts_.fstab.string();
    return res;
  }

  std::ofstream out(opts_.fstab, std::ios::app);
  if (!out) {
    res.detail = "cannot open " + opts_.fstab.string() + " for append";
    NM_LOG_ERROR("%s", res.detail.c_str());
    return res;
  }
  if (!table.empty() && table.back() != '\n') out << '\n';
  out << res.line << '\n';
  out.flush();
  if (!out.good()) {
    res.detail = "write to " + opts_.fstab.string() + " failed";
    NM_LOG_ERROR("%s", res.detail.c_str());
    return res;
  }

  res.outcome = model::MergeOutcome::Appended;
  NM_LOG_INFO("added %s -> %s to %s", entry.remote_path.c_str(), entry.local_path.c_str(), opts_.fstab.c_str());
  return res;
}

} // namespace netmount::core
