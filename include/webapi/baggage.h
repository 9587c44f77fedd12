#pragma once

// This component provides a class, `Baggage`, that is a bounded key/value
// store of strings carried along with a `TraceContext`.
//
// Baggage travels with a trace within the process: when a new `TraceContext`
// is started while another is current, the new context inherits the baggage of
// the current one.  When there is no baggage to inherit, it's read from the
// legacy "Correlation-Context" request header instead; see
// `Baggage::parse_correlation_context`.

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace webapi {
namespace correlation {

class Baggage {
 public:
  static constexpr std::size_t default_max_capacity = 64;
  static constexpr std::size_t unlimited_capacity =
      std::numeric_limits<std::size_t>::max();
  // Limits applied to items read from the "Correlation-Context" header.
  static constexpr std::size_t max_key_size = 50;
  static constexpr std::size_t max_value_size = 1024;

  /// Initializes an empty Baggage with the default maximum capacity.
  Baggage() = default;

  /// Initializes an empty Baggage instance with the given maximum capacity.
  ///
  /// @param `max_capacity` The maximum number of items.
  explicit Baggage(std::size_t max_capacity);

  /// Initializes a Baggage instance with the given items, in order.
  explicit Baggage(std::vector<std::pair<std::string, std::string>> items,
                   std::size_t max_capacity = default_max_capacity);

  /// Return a Baggage containing the items of a "Correlation-Context" header
  /// value.
  ///
  /// The value is a comma-separated list of `key=value` items.  An item that
  /// does not contain exactly one "=" is skipped.  The key is truncated to
  /// `max_key_size` characters and the value to `max_value_size` characters,
  /// and then both are trimmed of surrounding whitespace.  The number of
  /// items is not limited: the result has `unlimited_capacity`.
  ///
  /// @param `header_value` The value of the "Correlation-Context" header.
  static Baggage parse_correlation_context(std::string_view header_value);

  /// Checks if the Baggage contains a specified key.
  bool contains(std::string_view key) const;

  /// Retrieves the value associated with a specified key, or `std::nullopt`
  /// if the key is not found.
  std::optional<std::string_view> get(std::string_view key) const;

  /// Adds a key-value pair to the Baggage.
  ///
  /// If a `key` already exists, its value is overwritten with `value`.
  /// Otherwise, the pair is appended, unless the maximum capacity has been
  /// reached.
  ///
  /// @return `true` if the key-value pair was added or updated; `false` if
  /// the maximum capacity was reached.
  bool set(std::string key, std::string value);

  /// Removes the key-value pair corresponding to the specified key.
  void remove(std::string_view key);

  std::size_t size() const;
  bool empty() const;

  /// Invoke the specified `visitor` for each key-value pair, in insertion
  /// order.
  void visit(
      const std::function<void(std::string_view, std::string_view)>& visitor)
      const;

  inline bool operator==(const Baggage& rhs) const {
    return items_ == rhs.items_;
  }

 private:
  std::size_t max_capacity_ = Baggage::default_max_capacity;
  std::vector<std::pair<std::string, std::string>> items_;
};

}  // namespace correlation
}  // namespace webapi
