#pragma once
#include "model/Cpu.hpp"
#include <optional>
#include <string>
#include <vector>

namespace getcputime::collectors {

// proc(5) field numbers in /proc/<pid>/stat, 1-indexed
inline constexpr int kStateField = 3;
inline constexpr int kUtimeField = 14;
inline constexpr int kStimeField = 15;

// Parse the utime/stime pair out of one /proc/<pid>/stat record.
// std::nullopt if the record is truncated or malformed.
[[nodiscard]] std::optional<getcputime::model::CpuTicks> parse_stat_record(const std::string& content);

class TickSampler {
public:
  // One pass: read each pid's stat record once. Unreadable pids are
  // warned about and listed in CpuSnapshot::skipped.
  [[nodiscard]] getcputime::model::CpuSnapshot sample(const std::vector<int32_t>& pids) const;
};

} // namespace getcputime::collectors
