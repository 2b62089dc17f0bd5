#ifndef TIMING_T
#define TIMING_T

#include <chrono>

namespace Timing {

using namespace std::chrono_literals;

constexpr auto IOSleep       = 20ms;
constexpr auto EventWait     = 50ms;
constexpr auto InputTimeout  = 10ms;
constexpr auto FilterOverlay = 1000ms;
} // namespace Timing

#endif
