#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netmount::ui {

struct Choice {
  std::string tag;          // value returned when selected
  std::string description;  // shown next to the tag
};

// Operator interaction used by the provisioning pipeline. Every call blocks.
// Cancellation (Esc, Cancel button, EOF) is reported as an empty selection
// or std::nullopt and must end the caller's branch, never fail the run.
class Prompter {
public:
  virtual ~Prompter() = default;

  // Multi-select. Returns selected tags in option order.
  [[nodiscard]] virtual std::vector<std::string> choose(const std::string& title, const std::string& prompt,
                                                        const std::vector<Choice>& options) = 0;

  // Free text with a pre-filled default (returned on empty input).
  [[nodiscard]] virtual std::optional<std::string> prompt_text(const std::string& title, const std::string& def) = 0;

  // Secret input, never echoed.
  [[nodiscard]] virtual std::optional<std::string> prompt_secret(const std::string& title) = 0;

  [[nodiscard]] virtual bool confirm(const std::string& question) = 0;

  virtual void message(const std::string& title, const std::string& text) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

enum class Backend { Auto, Whiptail, Dialog, Plain };

// "auto" | "whiptail" | "dialog" | "plain"; unknown -> Auto
[[nodiscard]] Backend parse_backend(const std::string& s);

// Detects the requested backend once. Auto prefers whiptail, then dialog,
// then plain text. A requested tool that is missing falls back to plain.
[[nodiscard]] std::unique_ptr<Prompter> make_prompter(Backend backend);

} // namespace netmount::ui
