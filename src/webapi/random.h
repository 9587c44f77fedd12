#pragma once

// This component provides a function, `random_uint64`, that generates
// pseudo-random numbers.

#include <cstdint>

namespace webapi {
namespace correlation {

// Return a pseudo-random unsigned 64-bit integer, uniformly distributed over
// the full range of `std::uint64_t`.  The sequence generated is thread-local
// and seeded randomly.  The thread-local generator is reseeded when this
// process forks.
std::uint64_t random_uint64();

}  // namespace correlation
}  // namespace webapi
