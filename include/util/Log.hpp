#pragma once

#include <string>

namespace netmount::util {

enum class LogLevel { Debug, Info, Warn, Error };

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Unknown values return defv.
[[nodiscard]] LogLevel parse_log_level(const std::string& s, LogLevel defv);

// Process-wide sink configuration. An empty file path logs to stderr only.
void log_configure(LogLevel min_level, const std::string& file_path);

// One line per call: "[YYYY-MM-DD HH:MM:SS] netmount: LEVEL: message".
// Never pass secrets here.
void log_write(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace netmount::util

#define NM_LOG_DEBUG(...) ::netmount::util::log_write(::netmount::util::LogLevel::Debug, __VA_ARGS__)
#define NM_LOG_INFO(...)  ::netmount::util::log_write(::netmount::util::LogLevel::Info, __VA_ARGS__)
#define NM_LOG_WARN(...)  ::netmount::util::log_write(::netmount::util::LogLevel::Warn, __VA_ARGS__)
#define NM_LOG_ERROR(...) ::netmount::util::log_write(::netmount::util::LogLevel::Error, __VA_ARGS__)
