#include "core/MountActivator.hpp"
#include "util/Log.hpp"
#include "util/PathEscape.hpp"
#include "util/Procfs.hpp"

#include <sstream>

namespace netmount::core {

bool is_active_mount(const std::string& mounts_text, const std::string& local_path) {
  std::istringstream ss(mounts_text);
  std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    // an armed automount trap is not the mounted share
    if (fstype == "autofs") continue;
    if (util::unescape_mount_field(mountpoint) == local_path) return true;
  }
  return false;
}

MountActivator::MountActivator(util::CommandRunner& runner, bool dry_run) : runner_(runner), dry_run_(dry_run) {}

std::string MountActivator::unit_name(const std::string& local_path, const std::string& suffix) {
  return util::systemd_escape_path(local_path) + suffix;
}

bool MountActivator::systemctl(const std::vector<std::string>& args) {
  std::vector<std::string> argv{"systemctl"};
  argv.insert(argv.end(), args.begin(), args.end());
  if (dry_run_) {
    NM_LOG_INFO("[dry-run] %s", util::format_command(argv).c_str());
    return true;
  }
  auto res = runner_.run(argv, util::Capture::StdoutAndStderr);
  if (!res.ok()) {
    std::string out = res.output;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    NM_LOG_WARN("%s failed (status %d)%s%s", util::format_command(argv).c_str(), res.exit_code,
                out.empty() ? "" : ": ", out.c_str());
    return false;
  }
  return true;
}

model::ActivationResult MountActivator::activate(const model::MountEntry& entry) {
  systemctl({"daemon-reload"});

  if (dry_run_) {
    systemctl({"start", unit_name(entry.local_path, ".automount")});
    systemctl({"start", unit_name(entry.local_path, ".mount")});
    return model::ActivationResult::Deferred;
  }

  if (auto mounts = util::read_file_string("/proc/self/mounts"); mounts && is_active_mount(*mounts, entry.local_path)) {
    NM_LOG_INFO("%s is already mounted", entry.local_path.c_str());
    return model::ActivationResult::Started;
  }

  // automount unit first; it stays armed when the mount start fails
  systemctl({"start", unit_name(entry.local_path, ".automount")});
  if (systemctl({"start", unit_name(entry.local_path, ".mount")})) {
    NM_LOG_INFO("mounted %s at %s", entry.remote_path.c_str(), entry.local_path.c_str());
    return model::ActivationResult::Started;
  }
  NM_LOG_WARN("%s not mounted now, deferred to first access or next boot", entry.local_path.c_str());
  return model::ActivationResult::Deferred;
}

} // namespace netmount::core
