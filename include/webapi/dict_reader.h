#pragma once

// This component provides an interface, `DictReader`, that represents a
// read-only key/value mapping of strings.  It's used to read the headers of an
// inbound HTTP request.
//
// Implementations must compare keys case-insensitively, as HTTP header names
// are case-insensitive.  When a header occurs more than once, `lookup` returns
// the first occurrence.

#include <functional>
#include <optional>
#include <string_view>

namespace webapi {
namespace correlation {

class DictReader {
 public:
  virtual ~DictReader() {}

  // Return the value at the specified `key`, or return `std::nullopt` if there
  // is no value at `key`.
  virtual std::optional<std::string_view> lookup(
      std::string_view key) const = 0;

  // Invoke the specified `visitor` once for each key/value pair in this object.
  virtual void visit(
      const std::function<void(std::string_view key, std::string_view value)>&
          visitor) const = 0;
};

}  // namespace correlation
}  // namespace webapi
