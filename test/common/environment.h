#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

namespace webapi::test {

// For the lifetime of this object, set a specified environment variable.
// Restore any previous value (or unset the value if it was unset) afterward.
class EnvGuard {
  std::string name_;
  std::optional<std::string> former_value_;

 public:
  EnvGuard(std::string name, std::string value) : name_(std::move(name)) {
    const char* current = std::getenv(name_.c_str());
    if (current) {
      former_value_ = current;
    }
    set_value(value);
  }

  EnvGuard(const EnvGuard&) = delete;
  EnvGuard& operator=(const EnvGuard&) = delete;

  ~EnvGuard() {
    if (former_value_) {
      set_value(*former_value_);
    } else {
      unset();
    }
  }

  void set_value(const std::string& value) {
    const bool overwrite = true;
    ::setenv(name_.c_str(), value.c_str(), overwrite);
  }

  void unset() { ::unsetenv(name_.c_str()); }
};

}  // namespace webapi::test
