#pragma once

#include "model/Share.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace netmount::core {

// One credential file per host under a root-only directory, in the
// key=value format read by both mount.cifs and smbclient -A.
class CredentialStore {
public:
  explicit CredentialStore(std::filesystem::path dir, uid_t owner_uid = 0, gid_t owner_gid = 0);

  // Write (or replace) the credential file for host. The file is complete,
  // owned by the configured account and mode 0600 before it becomes
  // visible under its final name. Returns std::nullopt on invalid input or
  // any I/O failure (logged).
  [[nodiscard]] auto materialize(const std::string& host, const std::string& username,
                                 const std::string& secret) -> std::optional<model::CredentialFileRef>;

  [[nodiscard]] std::filesystem::path path_for(const std::string& host) const;

private:
  [[nodiscard]] bool ensure_directory() const;

  std::filesystem::path dir_;
  uid_t owner_uid_;
  gid_t owner_gid_;
};

} // namespace netmount::core
