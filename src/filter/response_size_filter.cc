#include "relay/filter/response_size_filter.h"

#include <cstring>
#include <vector>

#include "relay/filter/json_walk.h"

#define RELAY_LOG_COMPONENT "filter.response_size"
#include "relay/logging/log_macros.h"

namespace relay {
namespace filter {

namespace {

std::vector<std::string> splitSentences(const std::string& text) {
  std::vector<std::string> sentences;
  size_t start = 0;
  while (true) {
    size_t end = text.find(". ", start);
    if (end == std::string::npos) {
      sentences.push_back(text.substr(start));
      break;
    }
    sentences.push_back(text.substr(start, end - start));
    start = end + 2;
  }
  return sentences;
}

}  // namespace

std::string ResponseSizeFilter::summarize(const std::string& text,
                                          size_t min_length) {
  if (utf8Length(text) <= min_length) {
    return text;
  }
  std::vector<std::string> sentences = splitSentences(text);
  if (sentences.size() <= 3) {
    return text;
  }

  std::string summary;
  for (const std::string* part :
       {&sentences.front(), &sentences[sentences.size() / 2],
        &sentences.back()}) {
    if (part->empty()) {
      continue;
    }
    if (!summary.empty()) {
      summary += ". ";
    }
    summary += *part;
  }
  return kSummarizedPrefix + summary;
}

FilterStatus ResponseSizeFilter::apply(FilterContext& context,
                                       json::JsonValue& message) {
  const auto& settings = context.settings();

  std::vector<std::string> strings;
  collectStrings(message, strings, settings.max_depth);
  size_t total = 0;
  for (const auto& text : strings) {
    total += utf8Length(text);
  }

  if (total <= settings.summarize_threshold) {
    return FilterStatus::Continue;
  }

  if (total > settings.max_response_length) {
    const size_t marker_length = std::strlen(kTruncatedMarker);
    const bool fits_marker = settings.max_response_length >= marker_length;
    size_t remaining =
        fits_marker ? settings.max_response_length - marker_length : 0;
    bool exhausted = false;

    transformStrings(
        message,
        [&](const std::string& text) -> std::string {
          if (exhausted) {
            return std::string();
          }
          size_t length = utf8Length(text);
          if (length <= remaining) {
            remaining -= length;
            return text;
          }
          exhausted = true;
          std::string cut = text.substr(0, utf8Offset(text, remaining));
          remaining = 0;
          return fits_marker ? cut + kTruncatedMarker : cut;
        },
        settings.max_depth);

    context.recordAction(actions::kTruncated);
    if (settings.log_response_summaries) {
      RELAY_LOG(Info, "truncated response for session {} from {} to {}",
                context.sessionId(), total, settings.max_response_length);
    }
    return FilterStatus::Continue;
  }

  size_t summarized = transformStrings(
      message,
      [&settings](const std::string& text) {
        return summarize(text, settings.summarize_min_length);
      },
      settings.max_depth);

  if (summarized > 0) {
    context.recordAction(actions::kSummarized);
    if (settings.log_response_summaries) {
      RELAY_LOG(Info, "summarized {} string(s) for session {} ({} chars)",
                summarized, context.sessionId(), total);
    }
  }
  return FilterStatus::Continue;
}

}  // namespace filter
}  // namespace relay
