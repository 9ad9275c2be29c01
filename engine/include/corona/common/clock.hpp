#pragma once

#include <chrono>
#include <cstdint>

namespace corona::clock {
typedef std::chrono::steady_clock Time;

//! Microseconds since the process started
int64_t ticks();

//! Milliseconds since the process started, the time base for every update
int64_t ticks_ms();
} // namespace corona::clock
