#include "ui/Terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>

namespace netmount::ui {

bool tty_stdin() {
  return ::isatty(STDIN_FILENO) == 1;
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  const char* c = std::getenv("COLUMNS");
  if (c && *c) {
    try { return std::max(20, std::stoi(c)); } catch(...) {}
  }
  return 80;
}

int term_rows() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
    return ws.ws_row;
  const char* env = std::getenv("LINES");
  if (env) { int r = std::atoi(env); if (r > 0) return r; }
  return 24;
}

std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() {
  if (!tty_stdout()) return {};
  return std::string("\x1B[0m");
}

std::string sgr_bold() {
  return sgr("1");
}

EchoOffGuard::EchoOffGuard() {
  if (tty_stdin()) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~ECHO;
      if (tcsetattr(STDIN_FILENO, TCSANOW, &neo) == 0) active_ = true;
    }
  }
}

EchoOffGuard::~EchoOffGuard() {
  if (active_) tcsetattr(STDIN_FILENO, TCSANOW, &old_);
}

} // namespace netmount::ui
