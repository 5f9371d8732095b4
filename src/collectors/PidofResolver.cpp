#include "collectors/PidofResolver.hpp"
#include "util/Env.hpp"
#include "util/Log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <utility>

namespace getcputime::collectors {

PidofResolver::PidofResolver(std::string pidof_path) : pidof_path_(std::move(pidof_path)) {}

std::string PidofResolver::find_pidof() const {
  if (!pidof_path_.empty()) return pidof_path_;
  if (const char* p = getcputime::util::getenv_compat("GETCPUTIME_PIDOF_PATH")) return std::string(p);
  if (const char* path = std::getenv("PATH")) {
    std::string p(path); size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/pidof"; std::error_code ec;
        if (std::filesystem::exists(cand, ec)) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  // pidof lives in sbin on most distros, which is often missing from a user PATH
  const char* candidates[] = {"/usr/sbin/pidof", "/sbin/pidof", "/usr/bin/pidof", "/bin/pidof"};
  for (const char* c : candidates) { std::error_code ec; if (std::filesystem::exists(c, ec)) return std::string(c); }
  return std::string("pidof");
}

std::string PidofResolver::shell_quote(const std::string& word) {
  std::string out = "'";
  for (char c : word) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::vector<int32_t> PidofResolver::parse_pid_list(const std::string& text) {
  std::vector<int32_t> pids;
  size_t start = 0;
  while (start < text.size()) {
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    size_t end = start;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) ++end;
    if (end > start) {
      int32_t pid = 0;
      auto [ptr, ec] = std::from_chars(text.data() + start, text.data() + end, pid);
      if (ec == std::errc() && ptr == text.data() + end && pid > 0) pids.push_back(pid);
    }
    start = end;
  }
  std::sort(pids.begin(), pids.end());
  pids.erase(std::unique(pids.begin(), pids.end()), pids.end());
  return pids;
}

std::optional<std::vector<int32_t>> PidofResolver::resolve(const std::string& name) {
  std::string cmd = shell_quote(find_pidof()) + " " + shell_quote(name) + " 2>/dev/null";
  getcputime::util::log_debug("resolver: %s", cmd.c_str());
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    getcputime::util::log_error("cannot run pidof: %s", std::strerror(errno));
    return std::nullopt;
  }
  std::string out;
  char buf[512];
  while (std::fgets(buf, sizeof(buf), fp)) out += buf;
  int status = ::pclose(fp);
  if (status == -1 || !WIFEXITED(status)) {
    getcputime::util::log_error("pidof did not exit normally");
    return std::nullopt;
  }
  // pidof: 0 = at least one match, 1 = none; the shell reports 126/127 for a missing binary
  int code = WEXITSTATUS(status);
  if (code == 1) return std::vector<int32_t>{};
  if (code != 0) {
    getcputime::util::log_error("pidof exited with status %d", code);
    return std::nullopt;
  }
  return parse_pid_list(out);
}

} // namespace getcputime::collectors
