#pragma once

// This component provides an interface, `DictWriter`, that represents a
// write-only key/value mapping of strings.  It's used to set the correlation
// headers of an outbound HTTP response.

#include <string_view>

namespace webapi {
namespace correlation {

class DictWriter {
 public:
  virtual ~DictWriter() {}

  // Associate the specified `value` with the specified `key`.  An
  // implementation may, but need not, overwrite any previous value at `key`.
  virtual void set(std::string_view key, std::string_view value) = 0;
};

}  // namespace correlation
}  // namespace webapi
