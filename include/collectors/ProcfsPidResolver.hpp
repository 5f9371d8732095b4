#pragma once
#include "collectors/IPidResolver.hpp"

namespace getcputime::collectors {

// Scans /proc/<pid> directly and matches names the way pidof does:
// basename of argv[0], basename of the exe link, or the stat comm field.
class ProcfsPidResolver : public IPidResolver {
public:
  std::optional<std::vector<int32_t>> resolve(const std::string& name) override;
  const char* name() const override { return "/proc scan"; }

  static bool matches(int32_t pid, const std::string& name);
private:
  static std::string argv0_basename(int32_t pid);
  static std::string exe_basename(int32_t pid);
  static std::string stat_comm(int32_t pid);
};

} // namespace getcputime::collectors
