#pragma once

#include "model/Share.hpp"
#include "util/Exec.hpp"

#include <string>
#include <vector>

namespace netmount::core {

// Administrative or implicit share: name ending in '$' (IPC$, ADMIN$, C$,
// print$) or a share of type IPC / Printer.
[[nodiscard]] bool is_reserved_share(const std::string& name, const std::string& type);

// Parse `smbclient -L` output. Rows between the "Sharename" header (plus
// its dashed separator) and the next blank line are shares; the first
// whitespace-delimited token of a row is its name. Reserved shares are
// dropped and names deduplicated in listing order.
[[nodiscard]] auto parse_share_listing(const std::string& host, const std::string& text)
    -> std::vector<model::ShareDescriptor>;

class ShareEnumerator {
public:
  explicit ShareEnumerator(util::CommandRunner& runner);

  // Never fails hard: on bad credentials or an empty server the listing
  // has no shares and raw_output holds what the tool printed.
  [[nodiscard]] model::ShareListing list_shares(const std::string& host, const model::CredentialFileRef& cred);

  [[nodiscard]] static std::vector<std::string> command(const std::string& host, const model::CredentialFileRef& cred);

private:
  util::CommandRunner& runner_;
};

} // namespace netmount::core
