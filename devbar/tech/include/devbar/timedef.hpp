#pragma once

#include <chrono>

namespace devbar {

// Request timings are measured with a monotonic clock.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

// Durations reported to users (Server-Timing, panels) are in milliseconds with a fractional part.
using Milliseconds = std::chrono::duration<double, std::milli>;

}  // namespace devbar
