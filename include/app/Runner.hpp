#pragma once

#include "app/Config.hpp"
#include "collectors/IPidResolver.hpp"
#include "collectors/TickSampler.hpp"
#include "model/Cpu.hpp"

#include <functional>
#include <optional>
#include <ostream>

namespace getcputime::app {

// One invocation: clock ticks, resolve, sample, sleep, sample, report.
class Runner {
public:
  using Sleeper = std::function<void(unsigned seconds)>;

  // An empty sleeper blocks the calling thread for the requested seconds.
  Runner(RunConfig cfg, getcputime::collectors::IPidResolver& resolver, Sleeper sleeper = {});
  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;

  // Writes the report (or the "no processes" notice) to out. Returns the exit status.
  int run(std::ostream& out);

  [[nodiscard]] RunError last_error() const { return error_; }
  [[nodiscard]] const std::optional<getcputime::model::CpuReport>& report() const { return report_; }

private:
  RunConfig cfg_;
  getcputime::collectors::IPidResolver& resolver_;
  Sleeper sleeper_;
  getcputime::collectors::TickSampler sampler_;
  RunError error_{RunError::None};
  std::optional<getcputime::model::CpuReport> report_;
};

} // namespace getcputime::app
