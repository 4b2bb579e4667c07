#pragma once

#include "ui/Prompter.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace netmount::ui {

// Line-oriented prompts for terminals without whiptail or dialog.
class PlainPrompter : public Prompter {
public:
  PlainPrompter(std::istream& in, std::ostream& out);

  [[nodiscard]] std::vector<std::string> choose(const std::string& title, const std::string& prompt,
                                                const std::vector<Choice>& options) override;
  [[nodiscard]] std::optional<std::string> prompt_text(const std::string& title, const std::string& def) override;
  [[nodiscard]] std::optional<std::string> prompt_secret(const std::string& title) override;
  [[nodiscard]] bool confirm(const std::string& question) override;
  void message(const std::string& title, const std::string& text) override;
  [[nodiscard]] const char* name() const override { return "plain"; }

  // "1,3 4" -> {0,2,3}; "a"/"all" -> every index. Out-of-range or
  // non-numeric tokens make the whole answer invalid (nullopt).
  [[nodiscard]] static std::optional<std::vector<std::size_t>> parse_indices(const std::string& answer,
                                                                           std::size_t count);

private:
  bool read_line(std::string& line);

  std::istream& in_;
  std::ostream& out_;
};

} // namespace netmount::ui
