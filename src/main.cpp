#include "app/Config.hpp"
#include "app/Preflight.hpp"
#include "core/Pipeline.hpp"
#include "ui/Prompter.hpp"
#include "util/Exec.hpp"
#include "util/Log.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Private credential directory for --dry-run, removed on scope exit
class ScratchDir {
  fs::path path_;
public:
  ScratchDir() {
    std::string tmpl = (fs::temp_directory_path() / "netmount-dry-XXXXXX").string();
    if (::mkdtemp(tmpl.data())) path_ = tmpl;
  }
  ~ScratchDir() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) std::fprintf(stderr, "netmount: could not remove %s: %s\n", path_.c_str(), ec.message().c_str());
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;
  [[nodiscard]] const fs::path& path() const { return path_; }
};

unsigned long env_id(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) return 0;
  char* end = nullptr;
  unsigned long n = std::strtoul(v, &end, 10);
  if (!end || *end != '\0') return 0;
  return n;
}

void print_usage() {
  std::cout << "Usage: netmount [--config PATH] [--range CIDR] [--ui auto|whiptail|dialog|plain] [--dry-run]\n";
  std::cout << "Discovers SMB hosts, stores per-host credentials and adds on-demand CIFS mounts to fstab.\n";
  std::cout << "Must be run as root.\n";
}

} // namespace

int main(int argc, char** argv) {
  std::string config_arg, range_arg, ui_arg;
  bool dry_run = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_arg = argv[++i];
    else if (a == "--range" && i + 1 < argc) range_arg = argv[++i];
    else if (a == "--ui" && i + 1 < argc) ui_arg = argv[++i];
    else if (a == "--dry-run") dry_run = true;
    else if (a == "-h" || a == "--help") {
      print_usage();
      return 0;
    } else {
      std::fprintf(stderr, "ERROR: unknown or incomplete option '%s'\n", a.c_str());
      print_usage();
      return 1;
    }
  }

  auto cfg = netmount::app::load_config(netmount::app::config_file_path(config_arg));
  netmount::util::log_configure(netmount::util::parse_log_level(cfg.log.level, netmount::util::LogLevel::Info),
                                cfg.log.file);

  auto pre = netmount::app::check_preflight(::geteuid(), netmount::util::find_tool);
  for (const auto& w : pre.warnings) NM_LOG_WARN("%s", w.c_str());
  if (!pre.ok()) {
    for (const auto& e : pre.errors) std::fprintf(stderr, "ERROR: %s\n", e.c_str());
    return 1;
  }

  netmount::core::PipelineOptions opts;
  opts.mount_root = cfg.paths.mount_root;
  opts.credentials_dir = cfg.paths.credentials_dir;
  opts.fstab = cfg.paths.fstab;
  opts.port = cfg.scan.port;
  opts.iocharset = cfg.mount.iocharset;
  opts.dry_run = dry_run;
  if (const char* u = std::getenv("SUDO_USER")) opts.default_user = u;
  opts.default_uid = static_cast<uid_t>(env_id("SUDO_UID"));
  opts.default_gid = static_cast<gid_t>(env_id("SUDO_GID"));
  opts.credential_uid = ::geteuid();
  opts.credential_gid = ::getegid();

  std::optional<ScratchDir> scratch;
  if (dry_run) {
    scratch.emplace();
    if (scratch->path().empty()) {
      std::fprintf(stderr, "ERROR: cannot create temporary credentials directory\n");
      return 1;
    }
    opts.credentials_dir = scratch->path().string();
    NM_LOG_INFO("[dry-run] credentials go to %s; fstab and systemd are left untouched",
                opts.credentials_dir.c_str());
  }

  auto prompter = netmount::ui::make_prompter(netmount::ui::parse_backend(ui_arg.empty() ? cfg.ui.backend : ui_arg));
  NM_LOG_DEBUG("using %s prompts", prompter->name());

  netmount::util::SystemCommandRunner runner;
  netmount::core::Pipeline pipeline(opts, runner, *prompter);
  auto summary = pipeline.run(range_arg.empty() ? cfg.scan.range : range_arg);

  netmount::core::print_summary(summary, std::cout);
  if (summary.fatal) {
    std::fprintf(stderr, "ERROR: %s\n", summary.fatal_message.c_str());
    return 1;
  }
  return 0;
}
