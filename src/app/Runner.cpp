#include "app/Runner.hpp"
#include "app/Aggregator.hpp"
#include "app/ClockTick.hpp"
#include "util/Log.hpp"

#include <chrono>
#include <cstdlib>
#include <thread>
#include <utility>

namespace getcputime::app {

Runner::Runner(RunConfig cfg, getcputime::collectors::IPidResolver& resolver, Sleeper sleeper)
    : cfg_(std::move(cfg)), resolver_(resolver), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](unsigned seconds) { std::this_thread::sleep_for(std::chrono::seconds(seconds)); };
  }
}

int Runner::run(std::ostream& out) {
  using getcputime::util::log_debug;
  using getcputime::util::log_error;
  error_ = RunError::None;
  report_.reset();

  if (cfg_.process_name.empty() || cfg_.seconds == 0) {
    log_error("process name and a positive sleep duration are required");
    error_ = RunError::Usage;
    return EXIT_FAILURE;
  }

  auto hz = clock_tick_rate(cfg_.clk_tck);
  if (!hz) {
    log_error("could not determine CLK_TCK");
    error_ = RunError::Environment;
    return EXIT_FAILURE;
  }

  auto pids = resolver_.resolve(cfg_.process_name);
  if (!pids) {
    log_error("process lookup via %s failed", resolver_.name());
    error_ = RunError::Environment;
    return EXIT_FAILURE;
  }
  if (pids->empty()) {
    out << "No processes found with name '" << cfg_.process_name << "'\n";
    error_ = RunError::NotFound;
    return EXIT_FAILURE;
  }
  log_debug("%zu process(es) named '%s' via %s", pids->size(), cfg_.process_name.c_str(), resolver_.name());

  auto initial = sampler_.sample(*pids);
  auto t0 = std::chrono::steady_clock::now();
  sleeper_(cfg_.seconds);
  auto t1 = std::chrono::steady_clock::now();
  auto final_snap = sampler_.sample(*pids);

  // Nominal duration by default; the sampler's own overhead is not compensated
  double measured = std::chrono::duration<double>(t1 - t0).count();
  double seconds = static_cast<double>(cfg_.seconds);
  if (cfg_.measure_elapsed && measured > 0.0) seconds = measured;
  log_debug("interval: nominal %us, measured %.3fs, using %.3fs", cfg_.seconds, measured, seconds);

  if (!initial.skipped.empty() || !final_snap.skipped.empty())
    log_debug("unreadable stat records: %zu before, %zu after", initial.skipped.size(), final_snap.skipped.size());
  auto delta = compute_delta(initial, final_snap);
  if (!delta.excluded.empty())
    log_debug("%zu process(es) seen in only one sample, not counted", delta.excluded.size());

  report_ = make_report(delta, *hz, seconds);
  out << format_report(*report_) << "\n";
  return EXIT_SUCCESS;
}

} // namespace getcputime::app
