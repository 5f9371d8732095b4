#pragma once
#include <optional>

namespace getcputime::app {

// Scheduler ticks per second of CPU time. override_hz > 0 is returned as is,
// 0 asks sysconf(_SC_CLK_TCK), negative is invalid. std::nullopt when no
// positive rate is available.
[[nodiscard]] std::optional<long> clock_tick_rate(long override_hz = 0);

} // namespace getcputime::app
