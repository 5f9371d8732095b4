#pragma once

#include "model/Cpu.hpp"
#include <string>

namespace getcputime::app {

// Sum per-pid (final - initial) over the pids present in both snapshots.
// A pid seen in only one of them contributes nothing to either counter.
[[nodiscard]] auto compute_delta(const getcputime::model::CpuSnapshot& initial,
                                 const getcputime::model::CpuSnapshot& final_snap)
    -> getcputime::model::CpuDelta;

// Normalize tick totals by clk_tck * seconds; both must be positive.
[[nodiscard]] auto make_report(const getcputime::model::CpuDelta& delta, long clk_tck, double seconds)
    -> getcputime::model::CpuReport;

// "cpu:<t>% us_cpu:<u>% sy_cpu:<s>%" with two decimals each, no newline
[[nodiscard]] auto format_report(const getcputime::model::CpuReport& r) -> std::string;

} // namespace getcputime::app
