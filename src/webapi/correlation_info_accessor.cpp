#include <webapi/correlation_info_accessor.h>

namespace webapi {
namespace correlation {

std::optional<CorrelationInfo>
DefaultCorrelationInfoAccessor::correlation_info() const {
  return info_;
}

void DefaultCorrelationInfoAccessor::set_correlation_info(
    CorrelationInfo info) {
  info_.emplace(std::move(info));
}

}  // namespace correlation
}  // namespace webapi
