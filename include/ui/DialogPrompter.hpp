#pragma once

#include "ui/Prompter.hpp"
#include "util/Exec.hpp"

#include <memory>
#include <string>
#include <vector>

namespace netmount::ui {

// Full-screen menus through whiptail or dialog. Both tools draw on the
// inherited terminal and report the answer on stderr.
class DialogPrompter : public Prompter {
public:
  explicit DialogPrompter(std::string tool,
                          std::unique_ptr<util::CommandRunner> runner = std::make_unique<util::SystemCommandRunner>());

  [[nodiscard]] std::vector<std::string> choose(const std::string& title, const std::string& prompt,
                                                const std::vector<Choice>& options) override;
  [[nodiscard]] std::optional<std::string> prompt_text(const std::string& title, const std::string& def) override;
  [[nodiscard]] std::optional<std::string> prompt_secret(const std::string& title) override;
  [[nodiscard]] bool confirm(const std::string& question) override;
  void message(const std::string& title, const std::string& text) override;
  [[nodiscard]] const char* name() const override { return tool_.c_str(); }

  // Split --separate-output answer into tags (one per line, quotes stripped).
  [[nodiscard]] static std::vector<std::string> parse_selection(const std::string& out);

private:
  std::vector<std::string> base_args(const std::string& title) const;

  std::string tool_;
  std::unique_ptr<util::CommandRunner> runner_;
};

} // namespace netmount::ui
