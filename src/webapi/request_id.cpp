#include <webapi/request_id.h>

#include <re2/re2.h>

#include <cassert>

#include "string_util.h"

namespace webapi {
namespace correlation {
namespace {

constexpr const char request_id_pattern[] =
    R"(^(\|)?([a-zA-Z0-9\-]+(\.[a-zA-Z0-9\-]+)?)+(_|\.)?$)";

}  // namespace

RequestIdMatcher::RequestIdMatcher(const Clock& clock, Duration timeout)
    : regex_(std::make_unique<re2::RE2>(request_id_pattern, re2::RE2::Quiet)),
      clock_(clock),
      timeout_(timeout) {
  assert(regex_->ok());
}

RequestIdMatcher::~RequestIdMatcher() = default;

RequestIdMatcher::MatchResult RequestIdMatcher::match(
    std::string_view request_id) const {
  if (request_id.size() > max_request_id_size) {
    return MatchResult::NO_MATCH;
  }

  const TimePoint before = clock_();
  const bool matched = re2::RE2::FullMatch(
      re2::StringPiece(request_id.data(), request_id.size()), *regex_);
  if (clock_() - before > timeout_) {
    return MatchResult::TIMED_OUT;
  }

  return matched ? MatchResult::MATCH : MatchResult::NO_MATCH;
}

bool RequestIdMatcher::matches(std::string_view request_id) const {
  return match(request_id) == MatchResult::MATCH;
}

std::optional<std::string> extract_operation_parent_id(
    std::string_view request_id) {
  if (request_id.find('.') != request_id.npos) {
    const auto segments = split(request_id, '.');
    for (auto segment = segments.rbegin(); segment != segments.rend();
         ++segment) {
      if (!is_blank(*segment)) {
        return std::string(*segment);
      }
    }
    return std::nullopt;
  }

  if (starts_with(request_id, "|")) {
    request_id.remove_prefix(1);
  }
  if (request_id.empty()) {
    return std::nullopt;
  }
  return std::string(request_id);
}

}  // namespace correlation
}  // namespace webapi
