#include "collectors/ProcfsPidResolver.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cstdlib>
#include <string_view>

namespace getcputime::collectors {

static std::string basename_of(const std::string& path) {
  auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string ProcfsPidResolver::argv0_basename(int32_t pid) {
  auto bytes = getcputime::util::read_file_bytes(getcputime::util::pid_path(pid, "cmdline"));
  if (!bytes || bytes->empty()) return {}; // kernel threads have an empty cmdline
  std::string argv0;
  for (auto b : *bytes) { if (b == 0) break; argv0.push_back(static_cast<char>(b)); }
  return basename_of(argv0);
}

std::string ProcfsPidResolver::exe_basename(int32_t pid) {
  auto link = getcputime::util::read_symlink(getcputime::util::pid_path(pid, "exe"));
  if (!link) return {};
  auto base = basename_of(*link);
  // An unlinked binary shows up as "name (deleted)"
  constexpr std::string_view deleted = " (deleted)";
  if (base.size() > deleted.size() && base.ends_with(deleted)) base.resize(base.size() - deleted.size());
  return base;
}

std::string ProcfsPidResolver::stat_comm(int32_t pid) {
  auto content = getcputime::util::read_file_string(getcputime::util::pid_path(pid, "stat"));
  if (!content) return {};
  auto lp = content->find('('); auto rp = content->rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp) return {};
  return content->substr(lp + 1, rp - lp - 1);
}

bool ProcfsPidResolver::matches(int32_t pid, const std::string& name) {
  if (name.empty()) return false;
  if (argv0_basename(pid) == name) return true;
  if (exe_basename(pid) == name) return true;
  return stat_comm(pid) == name;
}

std::optional<std::vector<int32_t>> ProcfsPidResolver::resolve(const std::string& name) {
  auto entries = getcputime::util::list_dir("/proc");
  if (entries.empty()) {
    getcputime::util::log_error("cannot list %s", getcputime::util::map_proc_path("/proc").c_str());
    return std::nullopt;
  }
  std::vector<int32_t> pids;
  for (auto& entry : entries) {
    if (entry.empty() || entry[0] < '0' || entry[0] > '9') continue; // numeric
    int32_t pid = std::strtol(entry.c_str(), nullptr, 10);
    if (pid <= 0) continue;
    if (matches(pid, name)) pids.push_back(pid);
  }
  std::sort(pids.begin(), pids.end());
  getcputime::util::log_debug("resolver: /proc scan matched %zu of %zu entries", pids.size(), entries.size());
  return pids;
}

} // namespace getcputime::collectors
