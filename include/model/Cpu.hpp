#pragma once
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace getcputime::model {

// Cumulative per-process CPU time, in clock ticks (1/CLK_TCK seconds)
struct CpuTicks {
  uint64_t user{};   // utime
  uint64_t system{}; // stime
};

// One sampling pass over a pid set. Keyed by pid so the two passes never
// depend on the resolver returning pids in the same order.
struct CpuSnapshot {
  std::unordered_map<int32_t, CpuTicks> ticks;
  std::vector<int32_t> skipped; // unreadable during this pass
};

struct CpuDelta {
  uint64_t user_ticks{};
  uint64_t system_ticks{};
  std::size_t counted{};         // pids present in both snapshots
  std::vector<int32_t> excluded; // pids present in only one snapshot, ascending
};

struct CpuReport {
  double total_pct{};  // user_pct + system_pct, not capped at 100
  double user_pct{};
  double system_pct{};
  uint64_t user_ticks{};
  uint64_t system_ticks{};
  long clk_tck{};
  double seconds{};    // elapsed seconds used for normalization
};

} // namespace getcputime::model
