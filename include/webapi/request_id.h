#pragma once

// This component provides a class, `RequestIdMatcher`, that validates the
// value of the legacy "Request-Id" header of the hierarchical correlation
// format, and a function, `extract_operation_parent_id`, that derives the
// operation parent ID from a validated value.
//
// A request ID is a hierarchical, dot-separated identifier optionally
// prefixed by "|" and optionally suffixed by "_" or ".", e.g. "|abc.def." or
// "abc123".  The grammar is the regular expression
//
//     ^(\|)?([A-Za-z0-9-]+(\.[A-Za-z0-9-]+)?)+(_|\.)?$
//
// Header values are untrusted, so matching is bounded in time.  The expression
// is evaluated by RE2, whose running time is linear in the length of the
// input, and then the time actually taken is compared against a budget
// measured by an injected `Clock`.  A match that exceeds its budget is
// reported as `MatchResult::TIMED_OUT`, which callers treat the same as
// `MatchResult::NO_MATCH`.  Values longer than `max_request_id_size` are not
// matched at all.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "clock.h"

namespace re2 {
class RE2;
}  // namespace re2

namespace webapi {
namespace correlation {

constexpr std::size_t max_request_id_size = 8192;

class RequestIdMatcher {
  std::unique_ptr<const re2::RE2> regex_;
  Clock clock_;
  Duration timeout_;

 public:
  enum class MatchResult { MATCH, NO_MATCH, TIMED_OUT };

  static constexpr std::chrono::seconds default_timeout{1};

  explicit RequestIdMatcher(const Clock& clock = default_clock,
                            Duration timeout = default_timeout);
  ~RequestIdMatcher();

  RequestIdMatcher(const RequestIdMatcher&) = delete;
  RequestIdMatcher& operator=(const RequestIdMatcher&) = delete;

  MatchResult match(std::string_view request_id) const;

  // Return whether `match(request_id)` is `MatchResult::MATCH`.
  bool matches(std::string_view request_id) const;
};

// Return the operation parent ID contained in the specified `request_id`,
// which is assumed to have been validated by `RequestIdMatcher`.  If
// `request_id` contains a ".", then the result is its last non-blank
// dot-separated segment, e.g. "def" for "|abc.def.".  Otherwise, the result is
// `request_id` without its leading "|", if any, e.g. "abc123" for "|abc123".
// Return `std::nullopt` if there is no such nonempty ID.
std::optional<std::string> extract_operation_parent_id(
    std::string_view request_id);

}  // namespace correlation
}  // namespace webapi
