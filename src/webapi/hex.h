#pragma once

// This component provides a function, `hex_padded`, for formatting an integral
// value in hexadecimal.

#include <cassert>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <limits>
#include <string>
#include <system_error>

namespace webapi {
namespace correlation {

// Return the specified `value` formatted as a lower-case hexadecimal string
// left-padded with zeroes to the full width of `Integer`, e.g. 16 characters
// for a 64-bit integer.
template <typename Integer>
std::string hex_padded(Integer value) {
  constexpr int width = std::numeric_limits<Integer>::digits / 4;
  char buffer[width];

  const int base = 16;
  auto result =
      std::to_chars(std::begin(buffer), std::end(buffer), value, base);
  assert(result.ec == std::errc());

  std::string padded(width - (result.ptr - std::begin(buffer)), '0');
  padded.append(std::begin(buffer), result.ptr);
  return padded;
}

}  // namespace correlation
}  // namespace webapi
