#pragma once

// This component provides a function-like type, `Clock`, that returns the
// current time.  `Clock` is injected wherever elapsed time matters, so that
// tests can substitute a clock that they control.

#include <chrono>
#include <functional>

namespace webapi {
namespace correlation {

using Duration = std::chrono::steady_clock::duration;
using TimePoint = std::chrono::steady_clock::time_point;

using Clock = std::function<TimePoint()>;

extern const Clock default_clock;

}  // namespace correlation
}  // namespace webapi
