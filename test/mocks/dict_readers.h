#pragma once

#include <webapi/dict_reader.h>
#include <webapi/header_map.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

using namespace webapi::correlation;

class MockDictReader : public DictReader {
  const std::unordered_map<std::string, std::string>* map_;

 public:
  MockDictReader() : map_(nullptr){};
  explicit MockDictReader(
      const std::unordered_map<std::string, std::string>& map)
      : map_(&map) {}

  std::optional<std::string_view> lookup(std::string_view key) const override {
    if (map_ == nullptr) return std::nullopt;

    for (const auto& [name, value] : *map_) {
      if (equals_ignore_case(name, key)) {
        return value;
      }
    }
    return std::nullopt;
  }

  void visit(const std::function<void(std::string_view key,
                                      std::string_view value)>& visitor)
      const override {
    if (map_ == nullptr) return;

    for (const auto& [key, value] : *map_) {
      visitor(key, value);
    }
  }
};
