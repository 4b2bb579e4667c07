#include "ui/Prompter.hpp"
#include "ui/DialogPrompter.hpp"
#include "ui/PlainPrompter.hpp"
#include "ui/Terminal.hpp"
#include "util/Exec.hpp"
#include "util/Log.hpp"

#include <iostream>

namespace netmount::ui {

Backend parse_backend(const std::string& s) {
  if (s == "whiptail") return Backend::Whiptail;
  if (s == "dialog") return Backend::Dialog;
  if (s == "plain") return Backend::Plain;
  return Backend::Auto;
}

std::unique_ptr<Prompter> make_prompter(Backend backend) {
  // Full-screen tools need a terminal on both ends
  bool tty = tty_stdin() && tty_stdout();
  if (tty && (backend == Backend::Auto || backend == Backend::Whiptail)) {
    if (!util::find_tool("whiptail").empty()) return std::make_unique<DialogPrompter>("whiptail");
    if (backend == Backend::Whiptail) NM_LOG_WARN("whiptail not found, using plain prompts");
  }
  if (tty && (backend == Backend::Auto || backend == Backend::Dialog)) {
    if (!util::find_tool("dialog").empty()) return std::make_unique<DialogPrompter>("dialog");
    if (backend == Backend::Dialog) NM_LOG_WARN("dialog not found, using plain prompts");
  }
  return std::make_unique<PlainPrompter>(std::cin, std::cout);
}

} // namespace netmount::ui
