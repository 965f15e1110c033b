#include "relay/filter/secret_mask_filter.h"

#include <cstring>

#include "relay/filter/json_walk.h"
#include "relay/filter/text_scan.h"

#define RELAY_LOG_COMPONENT "filter.secret_masker"
#include "relay/logging/log_macros.h"

namespace relay {
namespace filter {

namespace {

bool isSecretChar(char c) {
  return isWordChar(c) || c == '-' || c == '.' || c == '/' || c == '+' ||
         c == '=';
}

// api_key=..., Secret-Token: "...", bearer token = ... (12+ value chars)
optional<TextSpan> findAssignedSecret(const std::string& text, size_t pos,
                                      size_t /*floor*/) {
  static const char* const kPrefixes[] = {"api", "secret", "access", "bearer"};
  if (!wordStartsAt(text, pos)) {
    return nullopt;
  }
  for (const char* prefix : kPrefixes) {
    if (!matchesAt(text, pos, prefix)) {
      continue;
    }
    size_t p = pos + std::strlen(prefix);
    if (p < text.size() && (text[p] == '-' || text[p] == '_' || text[p] == ' ')) {
      ++p;
    }
    if (matchesAt(text, p, "key")) {
      p += 3;
    } else if (matchesAt(text, p, "token")) {
      p += 5;
    } else {
      continue;
    }
    while (p < text.size() && isSpaceChar(text[p])) {
      ++p;
    }
    if (p >= text.size() || (text[p] != ':' && text[p] != '=')) {
      continue;
    }
    ++p;
    while (p < text.size() && isSpaceChar(text[p])) {
      ++p;
    }
    if (p < text.size() && (text[p] == '"' || text[p] == '\'')) {
      ++p;
    }
    size_t end = p;
    while (end < text.size() && isSecretChar(text[end])) {
      ++end;
    }
    if (end - p >= 12) {
      return TextSpan{pos, end};
    }
  }
  return nullopt;
}

// sk- followed by 20+ alphanumerics
optional<TextSpan> findSkKey(const std::string& text, size_t pos,
                             size_t /*floor*/) {
  if (!wordStartsAt(text, pos) || text.compare(pos, 3, "sk-") != 0) {
    return nullopt;
  }
  size_t end = pos + 3;
  while (end < text.size() && (isAlphaChar(text[end]) || isDigitChar(text[end]))) {
    ++end;
  }
  if (end - pos - 3 < 20) {
    return nullopt;
  }
  return TextSpan{pos, end};
}

// AWS access key id: AKIA plus exactly 16 upper-case letters or digits
optional<TextSpan> findAwsKeyId(const std::string& text, size_t pos,
                                size_t /*floor*/) {
  if (!wordStartsAt(text, pos) || text.compare(pos, 4, "AKIA") != 0 ||
      pos + 20 > text.size()) {
    return nullopt;
  }
  for (size_t i = pos + 4; i < pos + 20; ++i) {
    if (!isDigitChar(text[i]) && !(text[i] >= 'A' && text[i] <= 'Z')) {
      return nullopt;
    }
  }
  if (!wordEndsAt(text, pos + 20)) {
    return nullopt;
  }
  return TextSpan{pos, pos + 20};
}

}  // namespace

std::string maskSecrets(const std::string& text, uint64_t& masked) {
  std::string result = text;
  masked += replaceSpans(result, findAssignedSecret, kSecretSentinel);
  masked += replaceSpans(result, findSkKey, kSecretSentinel);
  masked += replaceSpans(result, findAwsKeyId, kSecretSentinel);
  return result;
}

FilterStatus SecretMaskFilter::apply(FilterContext& context,
                                     json::JsonValue& message) {
  uint64_t masked = 0;
  transformStrings(
      message,
      [&masked](const std::string& text) { return maskSecrets(text, masked); },
      context.settings().max_depth);

  if (masked > 0) {
    context.addRedactions("secret", masked);
    context.recordAction(actions::kSecretsMasked);
    logging::LogContext ctx;
    ctx.session_id = context.sessionId();
    ctx.direction = directionToString(context.direction());
    ctx.filter_name = kName;
    RELAY_LOG_WITH_CONTEXT(Info, ctx, "masked {} secret(s)", masked);
  }
  return FilterStatus::Continue;
}

}  // namespace filter
}  // namespace relay
