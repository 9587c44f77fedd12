#pragma once

// This component provides a class, `CorrelationInfo`, that holds the
// identifiers that correlate one HTTP request with the distributed operation
// that it's part of:
//
// - `operation_id` identifies the request itself.  It's never blank.
// - `transaction_id` identifies the end-to-end transaction.  It's absent only
//   when none was supplied and the configuration disables generating one.
// - `operation_parent_id` identifies the upstream operation that sent the
//   request, if any.
//
// A `CorrelationInfo` is immutable.

#include <optional>
#include <string>

namespace webapi {
namespace correlation {

class CorrelationInfo {
  std::string operation_id_;
  std::optional<std::string> transaction_id_;
  std::optional<std::string> operation_parent_id_;

 public:
  // Throw `std::invalid_argument` if the specified `operation_id` is blank.
  CorrelationInfo(std::string operation_id,
                  std::optional<std::string> transaction_id,
                  std::optional<std::string> operation_parent_id = {});

  const std::string& operation_id() const;
  const std::optional<std::string>& transaction_id() const;
  const std::optional<std::string>& operation_parent_id() const;
};

bool operator==(const CorrelationInfo&, const CorrelationInfo&);
bool operator!=(const CorrelationInfo&, const CorrelationInfo&);

}  // namespace correlation
}  // namespace webapi
