#pragma once

#include "model/Mount.hpp"
#include "util/Exec.hpp"

#include <string>
#include <vector>

namespace netmount::core {

// True if local_path is the mount point of a line in /proc/self/mounts text.
// autofs lines (automount triggers) do not count.
[[nodiscard]] bool is_active_mount(const std::string& mounts_text, const std::string& local_path);

// Drives systemd after the mount table changed. Never stops, removes or
// disables an existing mount.
class MountActivator {
public:
  explicit MountActivator(util::CommandRunner& runner, bool dry_run = false);

  // Started: the path is mounted (already, or by this call).
  // Deferred: the trigger failed; the automount unit or the next boot is
  // expected to mount it on first access.
  [[nodiscard]] model::ActivationResult activate(const model::MountEntry& entry);

  // "/mnt/10.0.0.5/data" + ".mount" -> "mnt-10.0.0.5-data.mount"
  [[nodiscard]] static std::string unit_name(const std::string& local_path, const std::string& suffix);

private:
  bool systemctl(const std::vector<std::string>& args);

  util::CommandRunner& runner_;
  bool dry_run_;
};

} // namespace netmount::core
