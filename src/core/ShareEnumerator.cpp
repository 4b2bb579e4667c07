#include "core/ShareEnumerator.hpp"
#include "util/Log.hpp"

#include <sstream>
#include <unordered_set>

namespace netmount::core {

bool is_reserved_share(const std::string& name, const std::string& type) {
  if (name.empty()) return true;
  if (name.back() == '$') return true;
  return type == "IPC" || type == "Printer";
}

auto parse_share_listing(const std::string& host, const std::string& text)
    -> std::vector<model::ShareDescriptor> {
  enum class State { BeforeHeader, AfterHeader, Rows };
  std::vector<model::ShareDescriptor> out;
  std::unordered_set<std::string> seen;
  State state = State::BeforeHeader;

  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    // Rows are whitespace-split: a share named "My Files" is read as "My"
    std::istringstream ls(line);
    std::string name, type;
    ls >> name >> type;

    if (state == State::BeforeHeader) {
      if (name == "Sharename") state = State::AfterHeader;
      continue;
    }
    if (name.empty()) {
      if (state == State::Rows) break; // end of the share table
      continue;
    }
    if (name.rfind("---", 0) == 0) { // separator row
      state = State::Rows;
      continue;
    }
    state = State::Rows;
    if (is_reserved_share(name, type)) continue;
    if (seen.insert(name).second) out.push_back(model::ShareDescriptor{host, name});
  }
  return out;
}

ShareEnumerator::ShareEnumerator(util::CommandRunner& runner) : runner_(runner) {}

std::vector<std::string> ShareEnumerator::command(const std::string& host, const model::CredentialFileRef& cred) {
  // Credentials travel through the file only, never on the command line.
  return {"smbclient", "-L", "//" + host, "-A", cred.path};
}

model::ShareListing ShareEnumerator::list_shares(const std::string& host, const model::CredentialFileRef& cred) {
  model::ShareListing listing;
  auto out = runner_.run(command(host, cred), util::Capture::StdoutAndStderr);
  listing.raw_output = out.output;
  listing.query_ok = out.ok();
  if (!out.launched) {
    NM_LOG_ERROR("failed to run smbclient for %s", host.c_str());
    listing.raw_output = "smbclient could not be started";
    return listing;
  }
  listing.shares = parse_share_listing(host, out.output);
  if (listing.shares.empty()) {
    NM_LOG_WARN("no usable shares listed on %s (smbclient exit status %d)", host.c_str(), out.exit_code);
  } else {
    NM_LOG_INFO("%zu share(s) on %s", listing.shares.size(), host.c_str());
  }
  return listing;
}

} // namespace netmount::core
