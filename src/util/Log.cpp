#include "util/Log.hpp"

#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace netmount::util {

namespace {
LogLevel g_min_level = LogLevel::Info;
std::FILE* g_file = nullptr;
}

LogLevel parse_log_level(const std::string& s, LogLevel defv) {
  std::string v;
  v.reserve(s.size());
  for (unsigned char c : s) v.push_back(static_cast<char>(std::tolower(c)));
  if (v == "debug") return LogLevel::Debug;
  if (v == "info") return LogLevel::Info;
  if (v == "warn" || v == "warning") return LogLevel::Warn;
  if (v == "error") return LogLevel::Error;
  return defv;
}

void log_configure(LogLevel min_level, const std::string& file_path) {
  g_min_level = min_level;
  if (g_file) {
    std::fclose(g_file);
    g_file = nullptr;
  }
  if (file_path.empty()) return;
  g_file = std::fopen(file_path.c_str(), "a");
  if (!g_file) {
    std::fprintf(stderr, "netmount: Log: failed to open %s: %s\n",
                 file_path.c_str(), std::strerror(errno));
  }
}

static const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

void log_write(LogLevel level, const char* fmt, ...) {
  if (level < g_min_level) return;

  auto now_t = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char ts[32];
  std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);

  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  std::fprintf(stderr, "[%s] netmount: %s: %s\n", ts, level_tag(level), msg);
  if (g_file) {
    std::fprintf(g_file, "[%s] netmount: %s: %s\n", ts, level_tag(level), msg);
    std::fflush(g_file);
  }
}

} // namespace netmount::util
