#include "core/Pipeline.hpp"
#include "core/CredentialStore.hpp"
#include "core/HostScanner.hpp"
#include "core/MountActivator.hpp"
#include "core/MountPlanner.hpp"
#include "core/ShareEnumerator.hpp"
#include "util/Log.hpp"

#include <string.h>

#include <charconv>
#include <optional>
#include <ostream>

namespace netmount::core {

namespace {

constexpr int kMaxIdAttempts = 3;

std::optional<unsigned long> parse_id(const std::string& s) {
  unsigned long v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size() || s.empty()) return std::nullopt;
  if (v > 0x7fffffffUL) return std::nullopt;
  return v;
}

void wipe(std::string& s) {
  if (!s.empty()) ::explicit_bzero(s.data(), s.size());
  s.clear();
}

ShareStatus status_for(model::MergeOutcome outcome, model::ActivationResult act) {
  switch (outcome) {
    case model::MergeOutcome::AlreadyExists: return ShareStatus::Existing;
    case model::MergeOutcome::Conflict: return ShareStatus::Conflict;
    case model::MergeOutcome::Failed: return ShareStatus::Failed;
    case model::MergeOutcome::DryRun: return ShareStatus::Planned;
    case model::MergeOutcome::Appended: break;
  }
  return act == model::ActivationResult::Started ? ShareStatus::Started : ShareStatus::Deferred;
}

} // namespace

const char* to_string(ShareStatus s) {
  switch (s) {
    case ShareStatus::Started: return "started";
    case ShareStatus::Deferred: return "deferred";
    case ShareStatus::Existing: return "already present";
    case ShareStatus::Planned: return "planned (dry run)";
    case ShareStatus::Conflict: return "conflict";
    case ShareStatus::Failed: return "failed";
  }
  return "unknown";
}

std::size_t RunSummary::soft_failures() const {
  std::size_t n = 0;
  for (const auto& h : hosts) {
    if (!h.failure.empty()) ++n;
    for (const auto& s : h.shares)
      if (s.status == ShareStatus::Conflict || s.status == ShareStatus::Failed) ++n;
  }
  return n;
}

Pipeline::Pipeline(PipelineOptions opts, util::CommandRunner& runner, ui::Prompter& prompter,
                   RangeResolver::AddressSource addresses)
  : opts_(std::move(opts)), runner_(runner), prompter_(prompter), addresses_(std::move(addresses)) {}

RunSummary Pipeline::run(const std::string& range_hint) {
  RunSummary summary;

  RangeResolver resolver(prompter_, addresses_);
  auto range = resolver.resolve(range_hint);
  if (!range) {
    summary.fatal = true;
    summary.fatal_message = "no network range to scan";
    return summary;
  }
  summary.range = range->to_string();

  HostScanner scanner(runner_, opts_.port);
  auto scan = scanner.scan(*range);
  if (!scan.ok) {
    summary.fatal = true;
    summary.fatal_message = scan.error;
    return summary;
  }
  summary.hosts_found = scan.hosts.size();
  if (scan.hosts.empty()) {
    NM_LOG_INFO("no SMB hosts found in %s", summary.range.c_str());
    prompter_.message("Scan", "No SMB hosts found in " + summary.range + ".");
    return summary;
  }

  std::vector<ui::Choice> choices;
  choices.reserve(scan.hosts.size());
  for (const auto& h : scan.hosts) choices.push_back({h.address, "SMB host"});
  auto picked = prompter_.choose("SMB hosts", "Select hosts to configure", choices);
  if (picked.empty()) {
    NM_LOG_INFO("no hosts selected");
    return summary;
  }

  CredentialStore store(opts_.credentials_dir, opts_.credential_uid, opts_.credential_gid);
  PlannerOptions popts;
  popts.mount_root = opts_.mount_root;
  popts.fstab = opts_.fstab;
  popts.iocharset = opts_.iocharset;
  popts.dry_run = opts_.dry_run;
  MountPlanner planner(popts);
  MountActivator activator(runner_, opts_.dry_run);

  for (const auto& host : picked) {
    HostResult hr;
    hr.host = host;
    process_host(host, store, planner, activator, hr);
    summary.hosts.push_back(std::move(hr));
  }
  return summary;
}

void Pipeline::process_host(const std::string& host, CredentialStore& store, MountPlanner& planner,
                            MountActivator& activator, HostResult& out) {
  ShareEnumerator enumerator(runner_);
  std::optional<model::CredentialFileRef> cred;
  model::ShareListing listing;

  for (;;) {
    auto user = prompter_.prompt_text("Username for " + host, opts_.default_user);
    if (!user) {
      out.cancelled = true;
      return;
    }
    auto secret = prompter_.prompt_secret("Password for " + *user + "@" + host);
    if (!secret) {
      out.cancelled = true;
      return;
    }
    cred = store.materialize(host, *user, *secret);
    wipe(*secret);
    if (!cred) {
      out.failure = "credential file could not be written";
      return;
    }
    out.credential_file = cred->path;

    listing = enumerator.list_shares(host, *cred);
    if (!listing.shares.empty()) break;

    NM_LOG_WARN("no shares listed for %s", host.c_str());
    std::string text = listing.raw_output.empty() ? std::string("(no output)") : listing.raw_output;
    prompter_.message("No shares on " + host, text);
    if (!prompter_.confirm("Retry " + host + " with different credentials?")) {
      out.failure = "no shares listed";
      return;
    }
  }

  std::vector<ui::Choice> choices;
  for (const auto& s : listing.shares) choices.push_back({s.name, "//" + host + "/" + s.name});
  auto shares = prompter_.choose("Shares on " + host, "Select shares to mount", choices);
  if (shares.empty()) {
    NM_LOG_INFO("no shares selected on %s", host.c_str());
    return;
  }

  uid_t uid = 0;
  gid_t gid = 0;
  bool cancelled = false;
  if (!prompt_owner(host, uid, gid, cancelled)) {
    if (cancelled) out.cancelled = true;
    else out.failure = "no valid owner";
    return;
  }

  for (const auto& share : shares) {
    auto entry = planner.plan(host, share, *cred, uid, gid);
    auto merged = planner.merge(entry);
    auto act = model::ActivationResult::Deferred;
    if (merged.outcome == model::MergeOutcome::Appended || merged.outcome == model::MergeOutcome::DryRun)
      act = activator.activate(entry);

    ShareResult sr;
    sr.share = share;
    sr.local_path = entry.local_path;
    sr.status = status_for(merged.outcome, act);
    if (merged.outcome == model::MergeOutcome::Conflict)
      sr.detail = "mount point already used by " + merged.detail;
    else if (merged.outcome == model::MergeOutcome::DryRun)
      sr.detail = merged.line;
    else
      sr.detail = merged.detail;
    out.shares.push_back(std::move(sr));
  }
}

bool Pipeline::prompt_owner(const std::string& host, uid_t& uid, gid_t& gid, bool& cancelled) {
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto u = prompter_.prompt_text("Owner UID for mounts from " + host, std::to_string(opts_.default_uid));
    if (!u) { cancelled = true; return false; }
    auto g = prompter_.prompt_text("Owner GID for mounts from " + host, std::to_string(opts_.default_gid));
    if (!g) { cancelled = true; return false; }
    auto pu = parse_id(*u);
    auto pg = parse_id(*g);
    if (pu && pg) {
      uid = static_cast<uid_t>(*pu);
      gid = static_cast<gid_t>(*pg);
      return true;
    }
    NM_LOG_WARN("invalid owner '%s:%s'", u->c_str(), g->c_str());
    prompter_.message("Invalid owner", "UID and GID must be non-negative numbers.");
  }
  return false;
}

void print_summary(const RunSummary& summary, std::ostream& out) {
  out << "\n==== netmount summary ====\n";
  if (summary.fatal) {
    out << "Aborted: " << summary.fatal_message << "\n";
    return;
  }
  out << "Range:        " << summary.range << "\n";
  out << "Hosts found:  " << summary.hosts_found << "\n";
  if (summary.hosts_found == 0) {
    out << "No SMB hosts found.\n";
    return;
  }

  out << "Credential files:\n";
  bool any = false;
  for (const auto& h : summary.hosts) {
    if (h.credential_file.empty()) continue;
    out << "  " << h.credential_file << "\n";
    any = true;
  }
  if (!any) out << "  (none)\n";

  out << "Mounts:\n";
  any = false;
  for (const auto& h : summary.hosts) {
    for (const auto& s : h.shares) {
      if (s.status == ShareStatus::Conflict || s.status == ShareStatus::Failed) continue;
      out << "  //" << h.host << "/" << s.share << " -> " << s.local_path << " [" << to_string(s.status) << "]\n";
      any = true;
    }
  }
  if (!any) out << "  (none)\n";

  for (const auto& h : summary.hosts)
    if (h.cancelled) out << "Skipped:      " << h.host << " (cancelled)\n";

  std::size_t n = summary.soft_failures();
  out << "Failures:     " << n << "\n";
  for (const auto& h : summary.hosts) {
    if (!h.failure.empty()) out << "  " << h.host << ": " << h.failure << "\n";
    for (const auto& s : h.shares) {
      if (s.status != ShareStatus::Conflict && s.status != ShareStatus::Failed) continue;
      out << "  //" << h.host << "/" << s.share << ": " << to_string(s.status);
      if (!s.detail.empty()) out << " (" << s.detail << ")";
      out << "\n";
    }
  }
}

} // namespace netmount::core
