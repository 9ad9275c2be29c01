#include <chrono>
#include <corona/common/clock.hpp>

namespace corona::clock
{
namespace
{
const auto process_start = Time::now();
}

int64_t ticks()
{
  return std::chrono::duration_cast<std::chrono::microseconds>(Time::now() - process_start).count();
}

int64_t ticks_ms()
{
  return ticks() / 1000;
}
} // namespace corona::clock
