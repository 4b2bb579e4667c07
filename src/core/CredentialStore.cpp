#include "core/CredentialStore.hpp"
#include "util/Log.hpp"
#include "util/PathEscape.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string.h>

namespace netmount::core {

CredentialStore::CredentialStore(std::filesystem::path dir, uid_t owner_uid, gid_t owner_gid)
    : dir_(std::move(dir)), owner_uid_(owner_uid), owner_gid_(owner_gid) {}

std::filesystem::path CredentialStore::path_for(const std::string& host) const {
  std::string name = util::sanitize_component(host);
  if (name.empty() || name == "." || name == "..") name = "_" + name;
  return dir_ / name;
}

bool CredentialStore::ensure_directory() const {
  std::error_code ec;
  if (std::filesystem::is_directory(dir_, ec)) return true;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    NM_LOG_ERROR("failed to create %s: %s", dir_.c_str(), ec.message().c_str());
    return false;
  }
  if (::chmod(dir_.c_str(), 0700) != 0) {
    NM_LOG_ERROR("failed to restrict %s: %s", dir_.c_str(), std::strerror(errno));
    return false;
  }
  return true;
}

static bool write_all(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

auto CredentialStore::materialize(const std::string& host, const std::string& username,
                                  const std::string& secret) -> std::optional<model::CredentialFileRef> {
  if (username.empty()) {
    NM_LOG_ERROR("empty username for %s", host.c_str());
    return std::nullopt;
  }
  auto has_newline = [](const std::string& s) { return s.find_first_of("\r\n") != std::string::npos; };
  if (has_newline(username) || has_newline(secret)) {
    NM_LOG_ERROR("username or password for %s contains a line break", host.c_str());
    return std::nullopt;
  }
  if (!ensure_directory()) return std::nullopt;

  const auto target = path_for(host);
  std::string tmpl = (dir_ / ("." + target.filename().string() + ".XXXXXX")).string();
  int fd = ::mkstemp(tmpl.data()); // created 0600
  if (fd < 0) {
    NM_LOG_ERROR("failed to create temporary credential file in %s: %s", dir_.c_str(), std::strerror(errno));
    return std::nullopt;
  }

  std::string content = "username=" + username + "\npassword=" + secret + "\n";
  bool ok = write_all(fd, content);
  ::explicit_bzero(content.data(), content.size());
  const char* step = "write";
  if (ok && ::fsync(fd) != 0) { ok = false; step = "fsync"; }
  // ownership and mode last, once the content is complete
  if (ok && ::fchown(fd, owner_uid_, owner_gid_) != 0) { ok = false; step = "chown"; }
  if (ok && ::fchmod(fd, 0600) != 0) { ok = false; step = "chmod"; }
  int saved_errno = errno;
  if (::close(fd) != 0 && ok) { ok = false; step = "close"; saved_errno = errno; }
  if (ok && ::rename(tmpl.c_str(), target.c_str()) != 0) { ok = false; step = "rename"; saved_errno = errno; }

  if (!ok) {
    ::unlink(tmpl.c_str());
    NM_LOG_ERROR("credential file for %s: %s failed: %s", host.c_str(), step, std::strerror(saved_errno));
    return std::nullopt;
  }

  NM_LOG_INFO("credentials for %s stored in %s", host.c_str(), target.c_str());
  return model::CredentialFileRef{host, target.string()};
}

} // namespace netmount::core
