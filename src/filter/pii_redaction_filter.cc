#include "relay/filter/pii_redaction_filter.h"

#include "relay/filter/json_walk.h"
#include "relay/filter/text_scan.h"

#define RELAY_LOG_COMPONENT "filter.pii_redactor"
#include "relay/logging/log_macros.h"

namespace relay {
namespace filter {

namespace {

bool isLocalPartChar(char c) {
  return isWordChar(c) || c == '.' || c == '%' || c == '+' || c == '-';
}

bool isDomainChar(char c) {
  return isAlphaChar(c) || isDigitChar(c) || c == '.' || c == '-';
}

bool isSeparator(char c) { return c == '-' || c == '.' || isSpaceChar(c); }

size_t skipSeparator(const std::string& text, size_t pos) {
  return pos < text.size() && isSeparator(text[pos]) ? pos + 1 : pos;
}

// local@domain.tld, anchored on the '@' so each byte is visited a bounded
// number of times
optional<TextSpan> findEmail(const std::string& text, size_t pos,
                             size_t floor) {
  if (text[pos] != '@') {
    return nullopt;
  }
  size_t begin = pos;
  while (begin > floor && isLocalPartChar(text[begin - 1])) {
    --begin;
  }
  while (begin < pos && !isWordChar(text[begin])) {
    ++begin;
  }
  if (begin == pos || (begin > 0 && isWordChar(text[begin - 1]))) {
    return nullopt;
  }

  size_t limit = pos + 1;
  while (limit < text.size() && isDomainChar(text[limit])) {
    ++limit;
  }
  // Longest domain ending in ".<2+ letters>" at a word boundary
  for (size_t end = limit; end > pos + 1; --end) {
    if (end != limit && text[end] != '.' && text[end] != '-') {
      continue;
    }
    if (!wordEndsAt(text, end)) {
      continue;
    }
    size_t tld = end;
    while (tld > pos + 1 && isAlphaChar(text[tld - 1])) {
      --tld;
    }
    if (end - tld >= 2 && tld >= pos + 3 && text[tld - 1] == '.') {
      return TextSpan{begin, end};
    }
  }
  return nullopt;
}

// Visa, Mastercard, Amex, Diners, Discover: a whole digit word of the
// issuer's length
optional<TextSpan> findCreditCard(const std::string& text, size_t pos,
                                  size_t /*floor*/) {
  if (!isDigitChar(text[pos]) || !wordStartsAt(text, pos)) {
    return nullopt;
  }
  size_t end = pos;
  while (end < text.size() && isDigitChar(text[end])) {
    ++end;
  }
  if (!wordEndsAt(text, end)) {
    return nullopt;
  }
  size_t length = end - pos;
  char first = text[pos];
  char second = length > 1 ? text[pos + 1] : '\0';
  bool issuer =
      (first == '4' && (length == 13 || length == 16)) ||
      (first == '5' && second >= '1' && second <= '5' && length == 16) ||
      (first == '3' && (second == '4' || second == '7') && length == 15) ||
      (first == '3' && length == 14) ||
      (length == 16 &&
       (text.compare(pos, 4, "6011") == 0 || (first == '6' && second == '5')));
  if (!issuer) {
    return nullopt;
  }
  return TextSpan{pos, end};
}

// ddd-dd-dddd with optional separators, excluding never-issued ranges
optional<TextSpan> findSsn(const std::string& text, size_t pos,
                           size_t /*floor*/) {
  if (!isDigitChar(text[pos]) || !wordStartsAt(text, pos)) {
    return nullopt;
  }
  size_t area = pos;
  if (!digitsAt(text, area, 3)) {
    return nullopt;
  }
  size_t group = skipSeparator(text, area + 3);
  if (!digitsAt(text, group, 2)) {
    return nullopt;
  }
  size_t serial = skipSeparator(text, group + 2);
  if (!digitsAt(text, serial, 4) || !wordEndsAt(text, serial + 4)) {
    return nullopt;
  }
  if (text.compare(area, 3, "000") == 0 || text.compare(area, 3, "666") == 0 ||
      text[area] == '9' || text.compare(group, 2, "00") == 0 ||
      text.compare(serial, 4, "0000") == 0) {
    return nullopt;
  }
  return TextSpan{pos, serial + 4};
}

// End of "(ddd) ddd-dddd" or "ddd-ddd-dddd" starting at |pos|, or npos
size_t phoneNumberEnd(const std::string& text, size_t pos) {
  size_t exchange;
  if (pos < text.size() && text[pos] == '(') {
    if (!digitsAt(text, pos + 1, 3) || pos + 4 >= text.size() ||
        text[pos + 4] != ')') {
      return std::string::npos;
    }
    exchange = pos + 5;
    if (exchange < text.size() && isSpaceChar(text[exchange])) {
      ++exchange;
    }
  } else {
    if (!wordStartsAt(text, pos) || !digitsAt(text, pos, 3)) {
      return std::string::npos;
    }
    exchange = skipSeparator(text, pos + 3);
  }
  if (!digitsAt(text, exchange, 3)) {
    return std::string::npos;
  }
  size_t line = skipSeparator(text, exchange + 3);
  if (!digitsAt(text, line, 4) || !wordEndsAt(text, line + 4)) {
    return std::string::npos;
  }
  return line + 4;
}

// NANP numbers with an optional +1 / 1 country prefix
optional<TextSpan> findPhone(const std::string& text, size_t pos,
                             size_t /*floor*/) {
  size_t country = text[pos] == '+' ? pos + 1 : pos;
  if (country < text.size() && text[country] == '1') {
    size_t end = phoneNumberEnd(text, skipSeparator(text, country + 1));
    if (end != std::string::npos) {
      return TextSpan{pos, end};
    }
  }
  size_t end = phoneNumberEnd(text, pos);
  if (end != std::string::npos) {
    return TextSpan{pos, end};
  }
  return nullopt;
}

}  // namespace

std::string redactPii(const std::string& text,
                      const FilterSettings& settings,
                      std::map<std::string, uint64_t>& counts) {
  std::string result = text;
  auto count = [&counts](const char* kind, uint64_t n) {
    if (n > 0) {
      counts[kind] += n;
    }
  };

  if (settings.redact_emails) {
    count("email", replaceSpans(result, findEmail, kEmailSentinel));
  }
  if (settings.redact_credit_cards) {
    count("credit_card",
          replaceSpans(result, findCreditCard, kCreditCardSentinel));
  }
  if (settings.redact_ssns) {
    count("ssn", replaceSpans(result, findSsn, kSsnSentinel));
  }
  if (settings.redact_phones) {
    count("phone", replaceSpans(result, findPhone, kPhoneSentinel));
  }
  return result;
}

FilterStatus PiiRedactionFilter::apply(FilterContext& context,
                                       json::JsonValue& message) {
  const auto& settings = context.settings();
  if (!settings.redact_emails && !settings.redact_phones &&
      !settings.redact_ssns && !settings.redact_credit_cards) {
    return FilterStatus::Continue;
  }

  std::map<std::string, uint64_t> counts;
  transformStrings(
      message,
      [&](const std::string& text) { return redactPii(text, settings, counts); },
      settings.max_depth);

  if (counts.empty()) {
    return FilterStatus::Continue;
  }

  uint64_t total = 0;
  for (const auto& entry : counts) {
    context.addRedactions(entry.first, entry.second);
    total += entry.second;
  }
  context.recordAction(actions::kPiiRedacted);

  if (settings.log_pii_redactions) {
    logging::LogContext ctx;
    ctx.session_id = context.sessionId();
    ctx.direction = directionToString(context.direction());
    ctx.filter_name = kName;
    RELAY_LOG_WITH_CONTEXT(Info, ctx, "redacted {} PII item(s)", total);
  }
  return FilterStatus::Continue;
}

}  // namespace filter
}  // namespace relay
