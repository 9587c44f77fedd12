#pragma once

// This component provides string-related miscellanea used while reading
// header values.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace webapi {
namespace correlation {

// Return the specified `text` without leading and trailing whitespace.
std::string_view trim(std::string_view text);

// Return whether the specified `text` is empty or consists only of
// whitespace.
bool is_blank(std::string_view text);

// Return at most the first `max_size` characters of the specified `text`.
std::string_view truncate(std::string_view text, std::size_t max_size);

// Return whether the specified `prefix` is a prefix of the specified `subject`.
bool starts_with(std::string_view subject, std::string_view prefix);

// Convert the specified `text` to lower case in-place.
void to_lower(std::string& text);

// Return the specified `text` split at every occurrence of `separator`.
// Empty pieces are kept.
std::vector<std::string_view> split(std::string_view text, char separator);

}  // namespace correlation
}  // namespace webapi
