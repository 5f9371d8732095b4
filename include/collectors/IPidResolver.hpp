#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace getcputime::collectors {

// Maps an executable name to the pids currently running it, so the
// run can swap between `pidof` and a native /proc scan (or a fixed set in tests).
class IPidResolver {
public:
  virtual ~IPidResolver() = default;

  // Matching pids, ascending and without duplicates. An empty vector means
  // nothing matched; std::nullopt means the lookup itself could not run.
  [[nodiscard]] virtual std::optional<std::vector<int32_t>> resolve(const std::string& name) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace getcputime::collectors
