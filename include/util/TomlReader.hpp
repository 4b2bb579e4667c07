#pragma once

#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>

namespace netmount::util {

// Reader for the flat TOML subset used by config.toml:
// [section] headers, key = value pairs, "quoted" strings, # comments.
// Arrays, inline tables and multi-line strings are not supported.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    load_string(ss.str());
    return true;
  }

  void load_string(const std::string& text) {
    values_.clear();
    std::istringstream in(text);
    std::string section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() == ']') section = std::string(trim(sv.substr(1, sv.size() - 2)));
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (key.empty()) continue;
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      values_[section + '.' + key] = val;
    }
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return values_.count(full_key(section, key)) != 0;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    auto it = values_.find(full_key(section, key));
    return it == values_.end() ? def : it->second;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    auto it = values_.find(full_key(section, key));
    if (it == values_.end() || it->second.empty()) return def;
    try { return std::stoi(it->second); } catch (...) { return def; }
  }

private:
  std::map<std::string, std::string> values_;

  static std::string full_key(std::string_view section, std::string_view key) {
    std::string k(section);
    k.push_back('.');
    k.append(key);
    return k;
  }

  // '#' outside a quoted string starts a comment
  static std::string_view strip_comment(std::string_view sv) {
    bool in_quote = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') in_quote = !in_quote;
      else if (sv[i] == '#' && !in_quote) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace netmount::util
