#include <webapi/baggage.h>

#include <algorithm>

#include "string_util.h"

namespace webapi {
namespace correlation {

Baggage::Baggage(std::size_t max_capacity) : max_capacity_(max_capacity) {}

Baggage::Baggage(std::vector<std::pair<std::string, std::string>> items,
                 std::size_t max_capacity)
    : max_capacity_(max_capacity) {
  for (auto& [key, value] : items) {
    set(std::move(key), std::move(value));
  }
}

Baggage Baggage::parse_correlation_context(std::string_view header_value) {
  Baggage result(unlimited_capacity);
  for (const std::string_view item : split(header_value, ',')) {
    const auto parts = split(item, '=');
    if (parts.size() != 2) {
      continue;
    }

    const auto key = trim(truncate(parts[0], max_key_size));
    const auto value = trim(truncate(parts[1], max_value_size));
    result.set(std::string(key), std::string(value));
  }
  return result;
}

bool Baggage::contains(std::string_view key) const {
  return get(key).has_value();
}

std::optional<std::string_view> Baggage::get(std::string_view key) const {
  const auto found =
      std::find_if(items_.begin(), items_.end(),
                   [&](const auto& item) { return item.first == key; });
  if (found == items_.end()) return std::nullopt;

  return found->second;
}

bool Baggage::set(std::string key, std::string value) {
  const auto found =
      std::find_if(items_.begin(), items_.end(),
                   [&](const auto& item) { return item.first == key; });
  if (found != items_.end()) {
    found->second = std::move(value);
    return true;
  }

  if (items_.size() == max_capacity_) return false;

  items_.emplace_back(std::move(key), std::move(value));
  return true;
}

void Baggage::remove(std::string_view key) {
  items_.erase(std::remove_if(items_.begin(), items_.end(),
                              [&](const auto& item) { return item.first == key; }),
               items_.end());
}

std::size_t Baggage::size() const { return items_.size(); }

bool Baggage::empty() const { return items_.empty(); }

void Baggage::visit(
    const std::function<void(std::string_view, std::string_view)>& visitor)
    const {
  for (const auto& [key, value] : items_) {
    visitor(key, value);
  }
}

}  // namespace correlation
}  // namespace webapi
