#include <webapi/header_map.h>

#include <algorithm>
#include <cctype>

namespace webapi {
namespace correlation {

bool equals_ignore_case(std::string_view left, std::string_view right) {
  return left.size() == right.size() &&
         std::equal(left.begin(), left.end(), right.begin(),
                    [](unsigned char a, unsigned char b) {
                      return std::tolower(a) == std::tolower(b);
                    });
}

HeaderMap::HeaderMap(
    std::initializer_list<std::pair<std::string, std::string>> entries)
    : entries_(entries) {}

void HeaderMap::add(std::string_view key, std::string_view value) {
  entries_.emplace_back(std::string(key), std::string(value));
}

std::vector<std::string_view> HeaderMap::lookup_all(
    std::string_view key) const {
  std::vector<std::string_view> values;
  for (const auto& [name, value] : entries_) {
    if (equals_ignore_case(name, key)) {
      values.emplace_back(value);
    }
  }
  return values;
}

std::size_t HeaderMap::size() const { return entries_.size(); }

bool HeaderMap::empty() const { return entries_.empty(); }

std::optional<std::string_view> HeaderMap::lookup(std::string_view key) const {
  const auto found =
      std::find_if(entries_.begin(), entries_.end(), [&](const auto& entry) {
        return equals_ignore_case(entry.first, key);
      });
  if (found == entries_.end()) {
    return std::nullopt;
  }
  return found->second;
}

void HeaderMap::visit(
    const std::function<void(std::string_view key, std::string_view value)>&
        visitor) const {
  for (const auto& [key, value] : entries_) {
    visitor(key, value);
  }
}

void HeaderMap::set(std::string_view key, std::string_view value) {
  entries_.erase(
      std::remove_if(entries_.begin(), entries_.end(),
                     [&](const auto& entry) {
                       return equals_ignore_case(entry.first, key);
                     }),
      entries_.end());
  add(key, value);
}

}  // namespace correlation
}  // namespace webapi
