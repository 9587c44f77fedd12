#include <webapi/correlation_info.h>

#include <stdexcept>

#include "string_util.h"

namespace webapi {
namespace correlation {

CorrelationInfo::CorrelationInfo(std::string operation_id,
                                 std::optional<std::string> transaction_id,
                                 std::optional<std::string> operation_parent_id)
    : operation_id_(std::move(operation_id)),
      transaction_id_(std::move(transaction_id)),
      operation_parent_id_(std::move(operation_parent_id)) {
  if (is_blank(operation_id_)) {
    throw std::invalid_argument(
        "Requires a non-blank operation ID to correlate a request");
  }
}

const std::string& CorrelationInfo::operation_id() const {
  return operation_id_;
}

const std::optional<std::string>& CorrelationInfo::transaction_id() const {
  return transaction_id_;
}

const std::optional<std::string>& CorrelationInfo::operation_parent_id()
    const {
  return operation_parent_id_;
}

bool operator==(const CorrelationInfo& left, const CorrelationInfo& right) {
  return left.operation_id() == right.operation_id() &&
         left.transaction_id() == right.transaction_id() &&
         left.operation_parent_id() == right.operation_parent_id();
}

bool operator!=(const CorrelationInfo& left, const CorrelationInfo& right) {
  return !(left == right);
}

}  // namespace correlation
}  // namespace webapi
