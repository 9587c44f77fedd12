#pragma once

// This component provides parsing-related miscellanea.

#include <webapi/expected.h>

#include <cstdint>
#include <string_view>

namespace webapi {
namespace correlation {

// Return a non-negative integer parsed from the specified `input` with respect
// to the specified `base`, or return an `Error` if no such integer can be
// parsed. It is an error unless all of `input` is consumed by the parse.
// Leading and trailing whitespace are not ignored.
Expected<std::uint64_t> parse_uint64(std::string_view input, int base);

// Return whether every character of the specified `input` is a lower-case
// hexadecimal digit, i.e. one of `[0-9a-f]`.
bool is_lower_hex(std::string_view input);

// Return the boolean value spelled by the specified `input`.  "1", "true", and
// "yes" are `true`; "0", "false", and "no" are `false`, without regard to
// case.  Anything else is an error.
Expected<bool> parse_bool(std::string_view input);

}  // namespace correlation
}  // namespace webapi
