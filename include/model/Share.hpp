#pragma once
#include <string>
#include <vector>

namespace netmount::model {

struct ShareDescriptor {
  std::string host;
  std::string name;
};

// Result of one share-listing query. raw_output is kept for diagnostics
// when shares is empty (bad credentials, server refused, etc).
struct ShareListing {
  std::vector<ShareDescriptor> shares;
  std::string raw_output;
  bool query_ok{false}; // tool launched and exited 0
};

// Path of a materialized credential file.
struct CredentialFileRef {
  std::string host;
  std::string path;
};

} // namespace netmount::model
