#ifndef TIMING_T
#define TIMING_T

#include <chrono>

namespace Timing {

using namespace std::chrono_literals;

constexpr auto PollInterval    = 50ms;
constexpr auto SpinnerInterval = 80ms;
constexpr auto InputTimeout    = 10ms;
} // namespace Timing

#endif
