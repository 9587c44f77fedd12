#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace webapi {
namespace correlation {
namespace {

constexpr std::string_view k_spaces_characters = " \f\n\r\t\v";

}  // namespace

std::string_view trim(std::string_view text) {
  text.remove_prefix(
      std::min(text.find_first_not_of(k_spaces_characters), text.size()));
  const auto pos = text.find_last_not_of(k_spaces_characters);
  if (pos != text.npos) text.remove_suffix(text.size() - pos - 1);
  return text;
}

bool is_blank(std::string_view text) {
  return text.find_first_not_of(k_spaces_characters) == text.npos;
}

std::string_view truncate(std::string_view text, std::size_t max_size) {
  return text.substr(0, max_size);
}

bool starts_with(std::string_view subject, std::string_view prefix) {
  if (prefix.size() > subject.size()) {
    return false;
  }

  return std::mismatch(subject.begin(), subject.end(), prefix.begin()).second ==
         prefix.end();
}

void to_lower(std::string& text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
}

std::vector<std::string_view> split(std::string_view text, char separator) {
  std::vector<std::string_view> pieces;
  std::size_t begin = 0;
  for (;;) {
    const std::size_t end = text.find(separator, begin);
    if (end == text.npos) {
      pieces.push_back(text.substr(begin));
      return pieces;
    }
    pieces.push_back(text.substr(begin, end - begin));
    begin = end + 1;
  }
}

}  // namespace correlation
}  // namespace webapi
