#include "parse_util.h"

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>

#include "string_util.h"

namespace webapi {
namespace correlation {

Expected<std::uint64_t> parse_uint64(std::string_view input, int base) {
  std::uint64_t value;
  const char* const end = input.data() + input.size();
  const auto status = std::from_chars(input.data(), end, value, base);
  if (status.ec == std::errc::invalid_argument) {
    std::string message;
    message += "Is not a valid integer: \"";
    message += input;
    message += '\"';
    return Error{Error::INVALID_INTEGER, std::move(message)};
  } else if (status.ptr != end) {
    std::string message;
    message += "Integer has trailing characters in: \"";
    message += input;
    message += '\"';
    return Error{Error::INVALID_INTEGER, std::move(message)};
  } else if (status.ec == std::errc::result_out_of_range) {
    std::string message;
    message += "Integer is not within the range of 64-bit unsigned: ";
    message += input;
    return Error{Error::OUT_OF_RANGE_INTEGER, std::move(message)};
  }
  return value;
}

bool is_lower_hex(std::string_view input) {
  return std::all_of(input.begin(), input.end(), [](char ch) {
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
  });
}

Expected<bool> parse_bool(std::string_view input) {
  std::string lower{trim(input)};
  to_lower(lower);
  if (lower == "1" || lower == "true" || lower == "yes") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no") {
    return false;
  }

  std::string message;
  message += "Is not a valid boolean: \"";
  message += input;
  message += "\".  Expected one of 1, true, yes, 0, false, or no.";
  return Error{Error::INVALID_BOOLEAN, std::move(message)};
}

}  // namespace correlation
}  // namespace webapi
