#pragma once

// This component provides a class, `HeaderMap`, that is an ordered,
// case-insensitive multimap of HTTP header names to values.
//
// `HeaderMap` implements both `DictReader` and `DictWriter`, so that a host
// that has no header type of its own can copy its request headers into a
// `HeaderMap`, and collect the correlation response headers from one.
//
// `lookup` returns the first value added under a name, compared without regard
// to case.  `set` replaces every existing value under a name, while `add`
// appends another value.

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "dict_reader.h"
#include "dict_writer.h"

namespace webapi {
namespace correlation {

class HeaderMap : public DictReader, public DictWriter {
  std::vector<std::pair<std::string, std::string>> entries_;

 public:
  HeaderMap() = default;
  HeaderMap(std::initializer_list<std::pair<std::string, std::string>>);

  void add(std::string_view key, std::string_view value);

  // Return all values under the specified `key`, in insertion order.
  std::vector<std::string_view> lookup_all(std::string_view key) const;

  std::size_t size() const;
  bool empty() const;

  // DictReader
  std::optional<std::string_view> lookup(std::string_view key) const override;
  void visit(const std::function<void(std::string_view key,
                                      std::string_view value)>& visitor)
      const override;

  // DictWriter
  void set(std::string_view key, std::string_view value) override;
};

// Return whether the specified `left` and `right` are equal when compared
// without regard to ASCII case.
bool equals_ignore_case(std::string_view left, std::string_view right);

}  // namespace correlation
}  // namespace webapi
