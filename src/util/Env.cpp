#include "util/Env.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace getcputime::util {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("GETCPUTIME_", 0) == 0) {
    alt = std::string("getcputime_") + n.substr(11);
  } else if (n.rfind("getcputime_", 0) == 0) {
    alt = std::string("GETCPUTIME_") + n.substr(11);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::optional<long> getenv_long(const char* name) {
  const char* v = getenv_compat(name);
  if (!v) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  long n = std::strtol(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0') return std::nullopt;
  return n;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  auto s = ascii_lower(v);
  if (s == "0" || s == "off" || s[0] == 'f' || s[0] == 'n') return false;
  return true;
}

std::string ascii_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace getcputime::util
