#pragma once
#include <string>

namespace netmount::util {

// Replace '/' and ':' with '_' so a share name is usable as one path
// component. Total and deterministic.
[[nodiscard]] std::string sanitize_component(const std::string& s);

// fstab(5) field escaping: ' ' -> "\040", '\t' -> "\011", '\n' -> "\012",
// '\\' -> "\134".
[[nodiscard]] std::string escape_mount_field(const std::string& s);

// Inverse of escape_mount_field for any \ooo octal sequence, as found in
// /etc/fstab and /proc/self/mounts.
[[nodiscard]] std::string unescape_mount_field(const std::string& s);

// systemd-escape --path: "/mnt/10.0.0.5/my share" -> "mnt-10.0.0.5-my\x20share"
[[nodiscard]] std::string systemd_escape_path(const std::string& path);

} // namespace netmount::util
