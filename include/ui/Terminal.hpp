#pragma once

#include <string>
#include <termios.h>

namespace netmount::ui {

// Terminal capability detection
[[nodiscard]] bool tty_stdin();
[[nodiscard]] bool tty_stdout();
[[nodiscard]] int term_cols();
[[nodiscard]] int term_rows();

// SGR code generation (empty when stdout is not a tty)
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_bold();

// RAII guard disabling terminal echo on stdin for secret input
class EchoOffGuard {
  bool active_{false};
  termios old_{};
public:
  EchoOffGuard();
  ~EchoOffGuard();
  EchoOffGuard(const EchoOffGuard&) = delete;
  EchoOffGuard& operator=(const EchoOffGuard&) = delete;
};

} // namespace netmount::ui
