#include "util/Log.hpp"

#include <cstdarg>

namespace getcputime::util {

static LogLevel g_level = LogLevel::Warn;
static std::FILE* g_stream = nullptr;

void set_log_level(LogLevel level) { g_level = level; }
LogLevel log_level() { return g_level; }

void set_log_stream(std::FILE* stream) { g_stream = stream; }
std::FILE* log_stream() { return g_stream; }

static void vlog(LogLevel level, const char* tag, const char* fmt, va_list ap) {
  if (static_cast<int>(level) > static_cast<int>(g_level)) return;
  std::FILE* out = g_stream ? g_stream : stderr;
  std::fputs("getcputime: ", out);
  std::fputs(tag, out);
  std::vfprintf(out, fmt, ap);
  std::fputc('\n', out);
  std::fflush(out);
}

void log_error(const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Error, "error: ", fmt, ap); va_end(ap);
}

void log_warn(const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Warn, "warning: ", fmt, ap); va_end(ap);
}

void log_debug(const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Debug, "debug: ", fmt, ap); va_end(ap);
}

} // namespace getcputime::util
