#pragma once

#include <string>
#include <vector>

namespace netmount::util {

// Which child streams are collected into CommandResult::output.
// Streams that are not captured stay attached to the parent's terminal.
enum class Capture { None, Stdout, Stderr, StdoutAndStderr };

struct CommandResult {
  bool launched{false};  // false if the program could not be started at all
  int exit_code{-1};     // exit status, or 128+signal
  std::string output;

  [[nodiscard]] bool ok() const { return launched && exit_code == 0; }
};

// Seam for running external tools so parsing and pipeline logic can be
// exercised without nmap, smbclient or systemctl installed.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  // argv[0] is resolved with find_tool. No shell is involved.
  [[nodiscard]] virtual CommandResult run(const std::vector<std::string>& argv, Capture capture) = 0;
};

// fork/execv implementation. Blocks until the child exits.
class SystemCommandRunner : public CommandRunner {
public:
  [[nodiscard]] CommandResult run(const std::vector<std::string>& argv, Capture capture) override;
};

// Locate an executable by name on PATH, then in the usual sbin/bin
// directories. Returns an empty string if not found.
[[nodiscard]] std::string find_tool(const std::string& name);

// Render argv for diagnostics (quotes arguments containing spaces).
[[nodiscard]] std::string format_command(const std::vector<std::string>& argv);

} // namespace netmount::util
