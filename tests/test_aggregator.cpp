#include "minitest.hpp"
#include "app/Aggregator.hpp"

#include <cstdio>

using getcputime::model::CpuSnapshot;
using getcputime::model::CpuTicks;

static CpuSnapshot snap(std::initializer_list<std::pair<const int32_t, CpuTicks>> items) {
  CpuSnapshot s;
  s.ticks = decltype(s.ticks)(items);
  return s;
}

TEST(aggregate_single_process_five_seconds) {
  auto d = getcputime::app::compute_delta(snap({{4242, {100, 50}}}), snap({{4242, {300, 150}}}));
  ASSERT_EQ(d.user_ticks, 200u);
  ASSERT_EQ(d.system_ticks, 100u);
  ASSERT_EQ(d.counted, 1u);
  auto r = getcputime::app::make_report(d, 100, 5.0);
  ASSERT_NEAR(r.user_pct, 40.0, 1e-9);
  ASSERT_NEAR(r.system_pct, 20.0, 1e-9);
  ASSERT_NEAR(r.total_pct, 60.0, 1e-9);
  ASSERT_EQ(getcputime::app::format_report(r), std::string("cpu:60.00% us_cpu:40.00% sy_cpu:20.00%"));
}

TEST(aggregate_sums_across_processes) {
  auto d = getcputime::app::compute_delta(
      snap({{1, {0, 0}}, {2, {10, 10}}, {3, {100, 0}}}),
      snap({{1, {25, 5}}, {2, {35, 20}}, {3, {150, 1}}}));
  ASSERT_EQ(d.user_ticks, 25u + 25u + 50u);
  ASSERT_EQ(d.system_ticks, 5u + 10u + 1u);
  ASSERT_EQ(d.counted, 3u);
  ASSERT_TRUE(d.excluded.empty());
}

TEST(aggregate_excludes_pid_seen_once) {
  // 7 vanished before the second sample, 9 was unreadable at the first one
  auto d = getcputime::app::compute_delta(
      snap({{5, {10, 10}}, {7, {0, 0}}}),
      snap({{5, {20, 15}}, {9, {500, 500}}}));
  ASSERT_EQ(d.user_ticks, 10u);
  ASSERT_EQ(d.system_ticks, 5u);
  ASSERT_EQ(d.counted, 1u);
  ASSERT_EQ(d.excluded.size(), 2u);
  ASSERT_EQ(d.excluded[0], 7);
  ASSERT_EQ(d.excluded[1], 9);
}

TEST(aggregate_recycled_pid_counts_nothing_negative) {
  auto d = getcputime::app::compute_delta(snap({{5, {1000, 40}}}), snap({{5, {3, 60}}}));
  ASSERT_EQ(d.user_ticks, 0u);
  ASSERT_EQ(d.system_ticks, 20u);
}

TEST(aggregate_empty_snapshots_report_zero) {
  auto d = getcputime::app::compute_delta(CpuSnapshot{}, CpuSnapshot{});
  auto r = getcputime::app::make_report(d, 100, 2.0);
  ASSERT_EQ(getcputime::app::format_report(r), std::string("cpu:0.00% us_cpu:0.00% sy_cpu:0.00%"));
}

TEST(report_exceeds_hundred_percent_uncapped) {
  // Four busy threads for 2s at 100Hz
  auto d = getcputime::app::compute_delta(snap({{1, {0, 0}}}), snap({{1, {700, 100}}}));
  auto r = getcputime::app::make_report(d, 100, 2.0);
  ASSERT_NEAR(r.total_pct, 400.0, 1e-9);
  ASSERT_EQ(getcputime::app::format_report(r), std::string("cpu:400.00% us_cpu:350.00% sy_cpu:50.00%"));
}

TEST(report_total_matches_user_plus_system) {
  // Odd tick counts so each part has a non-terminating fraction
  const long rates[] = {100, 250, 1000};
  for (long hz : rates) {
    for (unsigned secs = 1; secs <= 7; ++secs) {
      getcputime::model::CpuDelta d;
      d.user_ticks = 12345 % (hz * secs + 1);
      d.system_ticks = 6789 % (hz * secs + 1);
      auto r = getcputime::app::make_report(d, hz, secs);
      ASSERT_NEAR(r.total_pct, r.user_pct + r.system_pct, 1e-9);
      ASSERT_TRUE(r.user_pct >= 0.0 && r.system_pct >= 0.0);
      double t = 0, u = 0, s = 0;
      ASSERT_EQ(std::sscanf(getcputime::app::format_report(r).c_str(), "cpu:%lf%% us_cpu:%lf%% sy_cpu:%lf%%", &t, &u, &s), 3);
      ASSERT_NEAR(t, u + s, 0.005);
    }
  }
}

TEST(report_keeps_normalization_inputs) {
  getcputime::model::CpuDelta d; d.user_ticks = 3; d.system_ticks = 1;
  auto r = getcputime::app::make_report(d, 100, 3.0);
  ASSERT_EQ(r.clk_tck, 100);
  ASSERT_NEAR(r.seconds, 3.0, 0.0);
  ASSERT_EQ(r.user_ticks, 3u);
  ASSERT_EQ(r.system_ticks, 1u);
  ASSERT_EQ(getcputime::app::format_report(r), std::string("cpu:1.33% us_cpu:1.00% sy_cpu:0.33%"));
}
