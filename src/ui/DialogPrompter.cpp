#include "ui/DialogPrompter.hpp"
#include "ui/Terminal.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <sstream>

namespace netmount::ui {

namespace {

constexpr int kBoxHeight = 10;

int box_width() {
  return std::clamp(term_cols() - 10, 40, 78);
}

int list_height(std::size_t n) {
  int rows = term_rows() - 10;
  return std::clamp(static_cast<int>(n), 1, std::max(1, rows));
}

std::string trim_line(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

} // namespace

DialogPrompter::DialogPrompter(std::string tool, std::unique_ptr<util::CommandRunner> runner)
  : tool_(std::move(tool)), runner_(std::move(runner)) {}

std::vector<std::string> DialogPrompter::base_args(const std::string& title) const {
  return {tool_, "--title", title};
}

std::vector<std::string> DialogPrompter::parse_selection(const std::string& out) {
  std::vector<std::string> tags;
  std::istringstream in(out);
  std::string line;
  while (std::getline(in, line)) {
    line = trim_line(line);
    if (line.size() >= 2 && line.front() == '"' && line.back() == '"')
      line = line.substr(1, line.size() - 2);
    if (!line.empty()) tags.push_back(line);
  }
  return tags;
}

std::vector<std::string> DialogPrompter::choose(const std::string& title, const std::string& prompt,
                                                const std::vector<Choice>& options) {
  if (options.empty()) return {};
  auto argv = base_args(title);
  argv.push_back("--separate-output");
  argv.push_back("--checklist");
  argv.push_back(prompt);
  argv.push_back(std::to_string(list_height(options.size()) + 8));
  argv.push_back(std::to_string(box_width()));
  argv.push_back(std::to_string(list_height(options.size())));
  for (const auto& o : options) {
    argv.push_back(o.tag);
    argv.push_back(o.description.empty() ? o.tag : o.description);
    argv.push_back("OFF");
  }
  auto r = runner_->run(argv, util::Capture::Stderr);
  if (!r.ok()) {
    if (!r.launched) NM_LOG_ERROR("%s could not be started", tool_.c_str());
    return {};
  }
  auto picked = parse_selection(r.output);
  // Keep option order and drop anything the tool echoed that we did not offer
  std::vector<std::string> ordered;
  for (const auto& o : options) {
    if (std::find(picked.begin(), picked.end(), o.tag) != picked.end()) ordered.push_back(o.tag);
  }
  return ordered;
}

std::optional<std::string> DialogPrompter::prompt_text(const std::string& title, const std::string& def) {
  auto argv = base_args(title);
  argv.insert(argv.end(), {"--inputbox", title, std::to_string(kBoxHeight), std::to_string(box_width()), def});
  auto r = runner_->run(argv, util::Capture::Stderr);
  if (!r.ok()) return std::nullopt;
  std::string v = trim_line(r.output);
  if (v.empty()) return def;
  return v;
}

std::optional<std::string> DialogPrompter::prompt_secret(const std::string& title) {
  auto argv = base_args(title);
  argv.insert(argv.end(), {"--passwordbox", title, std::to_string(kBoxHeight), std::to_string(box_width())});
  auto r = runner_->run(argv, util::Capture::Stderr);
  if (!r.ok()) return std::nullopt;
  return trim_line(r.output);
}

bool DialogPrompter::confirm(const std::string& question) {
  auto argv = base_args("Confirm");
  argv.insert(argv.end(), {"--yesno", question, std::to_string(kBoxHeight), std::to_string(box_width())});
  // 0 = yes, 1 = no, 255 = escape
  return runner_->run(argv, util::Capture::Stderr).ok();
}

void DialogPrompter::message(const std::string& title, const std::string& text) {
  auto argv = base_args(title);
  int h = std::clamp(static_cast<int>(std::count(text.begin(), text.end(), '\n')) + 8, kBoxHeight,
                     std::max(kBoxHeight, term_rows() - 2));
  argv.insert(argv.end(), {"--msgbox", text, std::to_string(h), std::to_string(box_width())});
  auto r = runner_->run(argv, util::Capture::Stderr);
  if (!r.launched) NM_LOG_ERROR("%s could not be started", tool_.c_str());
}

} // namespace netmount::ui
