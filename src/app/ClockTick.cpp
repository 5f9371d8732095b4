#include "app/ClockTick.hpp"
#include "util/Log.hpp"

#include <unistd.h>

namespace getcputime::app {

std::optional<long> clock_tick_rate(long override_hz) {
  if (override_hz > 0) {
    getcputime::util::log_debug("clock ticks: %ld/s (configured)", override_hz);
    return override_hz;
  }
  if (override_hz < 0) return std::nullopt;
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz <= 0) return std::nullopt;
  getcputime::util::log_debug("clock ticks: %ld/s", hz);
  return hz;
}

} // namespace getcputime::app
