#include "relay/filter/blacklist_filter.h"

#include <algorithm>
#include <cctype>
#include <regex>

#include "relay/filter/json_walk.h"

#define RELAY_LOG_COMPONENT "filter.blacklist"
#include "relay/logging/log_macros.h"

namespace relay {
namespace filter {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

// std::regex matching recurses per character, so long strings are searched
// in overlapping windows. A match longer than kPatternOverlap that straddles
// a window boundary is not seen.
constexpr size_t kPatternWindow = 4096;
constexpr size_t kPatternOverlap = 256;

bool searchPattern(const std::string& text, const std::regex& pattern) {
  if (text.size() <= kPatternWindow) {
    return std::regex_search(text, pattern);
  }
  for (size_t start = 0; start < text.size();
       start += kPatternWindow - kPatternOverlap) {
    auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
    auto last = text.begin() + static_cast<std::ptrdiff_t>(
                                   std::min(text.size(), start + kPatternWindow));
    auto flags = start == 0 ? std::regex_constants::match_default
                            : std::regex_constants::match_prev_avail;
    if (std::regex_search(first, last, pattern, flags)) {
      return true;
    }
    if (last == text.end()) {
      break;
    }
  }
  return false;
}

// Returns the block reason, or an empty string when the text is clean
std::string findViolation(const std::string& text, const FilterConfig& config) {
  const auto& settings = config.settings();
  std::string lowered = toLower(text);

  for (const auto& domain : settings.blocked_domains) {
    if (!domain.empty() && lowered.find(toLower(domain)) != std::string::npos) {
      return "blocked domain: " + domain;
    }
  }
  for (const auto& keyword : settings.blocked_keywords) {
    if (!keyword.empty() &&
        lowered.find(toLower(keyword)) != std::string::npos) {
      return "blocked keyword: " + keyword;
    }
  }
  const auto& patterns = config.blockedPatterns();
  for (size_t i = 0; i < patterns.size(); ++i) {
    if (searchPattern(text, patterns[i])) {
      return "blocked pattern: " + config.blockedPatternSources()[i];
    }
  }
  return std::string();
}

}  // namespace

FilterStatus BlacklistFilter::apply(FilterContext& context,
                                    json::JsonValue& message) {
  const auto& settings = context.settings();
  std::vector<std::string> strings;
  std::string reason;

  if (!collectStrings(message, strings, settings.max_depth)) {
    reason = "message nesting too deep";
  } else {
    for (const auto& text : strings) {
      reason = findViolation(text, context.config());
      if (!reason.empty()) {
        break;
      }
    }
  }

  if (reason.empty()) {
    return FilterStatus::Continue;
  }

  context.recordAction(actions::kBlacklisted);
  context.block(reason);
  if (settings.log_blocked_content) {
    logging::LogContext ctx;
    ctx.session_id = context.sessionId();
    ctx.direction = directionToString(context.direction());
    ctx.filter_name = kName;
    RELAY_LOG_WITH_CONTEXT(Warning, ctx, "blocked request: {}", reason);
  }
  return FilterStatus::StopIteration;
}

}  // namespace filter
}  // namespace relay
