// stderr diagnostics in the "getcputime: <what>" form
#pragma once
#include <cstdio>

namespace getcputime::util {

enum class LogLevel { Error = 0, Warn = 1, Debug = 2 };

// Messages above this level are dropped. Default: Warn.
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

// Redirect output (tests use tmpfile()). nullptr restores stderr.
void set_log_stream(std::FILE* stream);
[[nodiscard]] std::FILE* log_stream(); // as last set, nullptr = stderr

void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace getcputime::util
