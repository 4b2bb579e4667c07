#include "ui/PlainPrompter.hpp"
#include "ui/Terminal.hpp"

#include <algorithm>
#include <istream>
#include <ostream>
#include <set>

namespace netmount::ui {

PlainPrompter::PlainPrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

bool PlainPrompter::read_line(std::string& line) {
  out_.flush();
  if (!std::getline(in_, line)) return false;
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return true;
}

std::optional<std::vector<std::size_t>> PlainPrompter::parse_indices(const std::string& answer, std::size_t count) {
  std::string s = answer;
  for (char& c : s) if (c == ',') c = ' ';
  std::set<std::size_t> picked;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && s[i] == ' ') ++i;
    std::size_t j = i;
    while (j < s.size() && s[j] != ' ') ++j;
    if (j == i) break;
    std::string tok = s.substr(i, j - i);
    i = j;
    if (tok == "a" || tok == "all") {
      for (std::size_t k = 0; k < count; ++k) picked.insert(k);
      continue;
    }
    if (!std::all_of(tok.begin(), tok.end(), [](char c) { return c >= '0' && c <= '9'; })) return std::nullopt;
    if (tok.size() > 6) return std::nullopt;
    std::size_t n = static_cast<std::size_t>(std::stoul(tok));
    if (n < 1 || n > count) return std::nullopt;
    picked.insert(n - 1);
  }
  return std::vector<std::size_t>(picked.begin(), picked.end());
}

std::vector<std::string> PlainPrompter::choose(const std::string& title, const std::string& prompt,
                                               const std::vector<Choice>& options) {
  if (options.empty()) return {};
  out_ << "\n" << sgr_bold() << title << sgr_reset() << "\n";
  for (std::size_t i = 0; i < options.size(); ++i) {
    out_ << "  " << (i + 1) << ") " << options[i].tag;
    if (!options[i].description.empty() && options[i].description != options[i].tag)
      out_ << "  " << options[i].description;
    out_ << "\n";
  }
  for (;;) {
    out_ << prompt << " (numbers, 'a' for all, empty to skip): ";
    std::string line;
    if (!read_line(line)) return {};
    if (line.find_first_not_of(" \t") == std::string::npos) return {};
    auto idx = parse_indices(line, options.size());
    if (!idx) {
      out_ << "Invalid selection.\n";
      continue;
    }
    std::vector<std::string> tags;
    for (auto k : *idx) tags.push_back(options[k].tag);
    return tags;
  }
}

std::optional<std::string> PlainPrompter::prompt_text(const std::string& title, const std::string& def) {
  out_ << title;
  if (!def.empty()) out_ << " [" << def << "]";
  out_ << ": ";
  std::string line;
  if (!read_line(line)) return std::nullopt;
  if (line.empty()) return def;
  return line;
}

std::optional<std::string> PlainPrompter::prompt_secret(const std::string& title) {
  out_ << title << ": ";
  std::string line;
  bool got;
  {
    EchoOffGuard guard;
    got = read_line(line);
  }
  out_ << "\n";
  if (!got) return std::nullopt;
  return line;
}

bool PlainPrompter::confirm(const std::string& question) {
  out_ << question << " [y/N]: ";
  std::string line;
  if (!read_line(line)) return false;
  return line == "y" || line == "Y" || line == "yes" || line == "YES" || line == "Yes";
}

void PlainPrompter::message(const std::string& title, const std::string& text) {
  out_ << "\n" << sgr_bold() << title << sgr_reset() << "\n" << text << "\n";
  out_.flush();
}

} // namespace netmount::ui
