#include "util/PathEscape.hpp"

#include <cstdio>

namespace netmount::util {

std::string sanitize_component(const std::string& s) {
  std::string out = s;
  for (auto& c : out) {
    if (c == '/' || c == ':') c = '_';
  }
  return out;
}

std::string escape_mount_field(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case ' ':  out += "\\040"; break;
      case '\t': out += "\\011"; break;
      case '\n': out += "\\012"; break;
      case '\\': out += "\\134"; break;
      default:   out.push_back(c);
    }
  }
  return out;
}

static bool is_octal(char c) { return c >= '0' && c <= '7'; }

static bool is_ascii_alnum(unsigned char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

std::string unescape_mount_field(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() && is_octal(s[i + 1]) && is_octal(s[i + 2]) && is_octal(s[i + 3])) {
      int v = (s[i + 1] - '0') * 64 + (s[i + 2] - '0') * 8 + (s[i + 3] - '0');
      out.push_back(static_cast<char>(v));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

std::string systemd_escape_path(const std::string& path) {
  // collapse duplicate slashes and strip leading/trailing ones
  std::string p;
  for (char c : path) {
    if (c == '/' && (p.empty() || p.back() == '/')) continue;
    p.push_back(c);
  }
  while (!p.empty() && p.back() == '/') p.pop_back();
  if (p.empty()) return "-";

  std::string out;
  for (size_t i = 0; i < p.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(p[i]);
    if (c == '/') {
      out.push_back('-');
    } else if (is_ascii_alnum(c) || c == '_' || c == ':' || (c == '.' && i != 0)) {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[5];
      std::snprintf(buf, sizeof(buf), "\\x%02x", c);
      out += buf;
    }
  }
  return out;
}

} // namespace netmount::util
