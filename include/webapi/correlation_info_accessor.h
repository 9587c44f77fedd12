#pragma once

// This component provides an interface, `CorrelationInfoAccessor`, through
// which `HttpCorrelation` stores the `CorrelationInfo` of a request, and
// through which application code retrieves it while handling the request.
//
// An accessor is scoped to one request.  The host creates one for each
// in-flight request and discards it when the request is done.
// `HttpCorrelation` sets the `CorrelationInfo` at most once per request.
//
// `DefaultCorrelationInfoAccessor` is an accessor that simply holds the
// `CorrelationInfo` in a data member.

#include <optional>

#include "correlation_info.h"

namespace webapi {
namespace correlation {

class CorrelationInfoAccessor {
 public:
  virtual ~CorrelationInfoAccessor() {}

  // Return the `CorrelationInfo` of the current request, or `std::nullopt` if
  // it hasn't been set.
  virtual std::optional<CorrelationInfo> correlation_info() const = 0;

  virtual void set_correlation_info(CorrelationInfo) = 0;
};

class DefaultCorrelationInfoAccessor : public CorrelationInfoAccessor {
  std::optional<CorrelationInfo> info_;

 public:
  std::optional<CorrelationInfo> correlation_info() const override;
  void set_correlation_info(CorrelationInfo) override;
};

}  // namespace correlation
}  // namespace webapi
