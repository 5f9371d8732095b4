#include "app/Aggregator.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace getcputime::app {

auto compute_delta(const getcputime::model::CpuSnapshot& initial,
                   const getcputime::model::CpuSnapshot& final_snap) -> getcputime::model::CpuDelta {
  getcputime::model::CpuDelta d;
  for (const auto& [pid, t0] : initial.ticks) {
    auto it = final_snap.ticks.find(pid);
    if (it == final_snap.ticks.end()) { d.excluded.push_back(pid); continue; }
    const auto& t1 = it->second;
    // Counters only go backwards when the pid was recycled; count nothing for it
    uint64_t du = t1.user >= t0.user ? t1.user - t0.user : 0;
    uint64_t ds = t1.system >= t0.system ? t1.system - t0.system : 0;
    getcputime::util::log_debug("pid %d: +%llu user +%llu system ticks", pid,
                                static_cast<unsigned long long>(du), static_cast<unsigned long long>(ds));
    d.user_ticks += du;
    d.system_ticks += ds;
    d.counted++;
  }
  for (const auto& [pid, t1] : final_snap.ticks) {
    if (!initial.ticks.contains(pid)) d.excluded.push_back(pid);
  }
  std::sort(d.excluded.begin(), d.excluded.end());
  return d;
}

auto make_report(const getcputime::model::CpuDelta& delta, long clk_tck, double seconds)
    -> getcputime::model::CpuReport {
  getcputime::model::CpuReport r;
  r.user_ticks = delta.user_ticks;
  r.system_ticks = delta.system_ticks;
  r.clk_tck = clk_tck;
  r.seconds = seconds;
  const double denom = static_cast<double>(clk_tck) * seconds;
  r.user_pct = 100.0 * static_cast<double>(delta.user_ticks) / denom;
  r.system_pct = 100.0 * static_cast<double>(delta.system_ticks) / denom;
  r.total_pct = r.user_pct + r.system_pct;
  return r;
}

static double round2(double v) { return std::round(v * 100.0) / 100.0; }

auto format_report(const getcputime::model::CpuReport& r) -> std::string {
  // total is the sum of the printed parts, so the three fields always add up
  const double user = round2(r.user_pct);
  const double sys = round2(r.system_pct);
  char buf[128];
  std::snprintf(buf, sizeof(buf), "cpu:%.2f%% us_cpu:%.2f%% sy_cpu:%.2f%%", user + sys, user, sys);
  return std::string(buf);
}

} // namespace getcputime::app
