#include <webapi/clock.h>

namespace webapi {
namespace correlation {

const Clock default_clock = []() { return std::chrono::steady_clock::now(); };

}  // namespace correlation
}  // namespace webapi
