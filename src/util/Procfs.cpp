#include "util/Procfs.hpp"
#include "util/Env.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace getcputime::util {

static std::string proc_root() {
  const char* env = getenv_compat("GETCPUTIME_PROC_ROOT");
  if (env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // /proc files can disappear between open and read (ESRCH surfaces as badbit)
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>> {
  std::ifstream in(map_proc_path(abs), std::ios::binary);
  if (!in) return std::nullopt;
  std::vector<unsigned char> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return buf;
}

auto read_symlink(const std::string& abs) -> std::optional<std::string> {
  std::error_code ec;
  auto target = std::filesystem::read_symlink(map_proc_path(abs), ec);
  if (ec) return std::nullopt;
  return target.string();
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_proc_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto pid_path(int32_t pid, const char* leaf) -> std::string {
  return std::string("/proc/") + std::to_string(pid) + "/" + leaf;
}

} // namespace getcputime::util
