#include "relay/filter/filter_config.h"

#include <fmt/format.h>

#include "relay/core/error_codes.h"

#define RELAY_LOG_COMPONENT "filter.config"
#include "relay/logging/log_macros.h"

namespace relay {
namespace filter {

namespace {

// Field readers throw this; fromJson turns it into an Error
struct FieldError {
  std::string key;
  std::string expected;
};

void readBool(const json::JsonValue& value, const std::string& key,
              bool& out) {
  if (auto field = value.find(key)) {
    if (!field->isBoolean()) {
      throw FieldError{key, "a boolean"};
    }
    out = field->getBool();
  }
}

void readSize(const json::JsonValue& value, const std::string& key,
              size_t& out) {
  if (auto field = value.find(key)) {
    if (!field->isInteger() || field->getInt64() < 0) {
      throw FieldError{key, "a non-negative integer"};
    }
    out = static_cast<size_t>(field->getInt64());
  }
}

void readStrings(const json::JsonValue& value, const std::string& key,
                 std::vector<std::string>& out) {
  auto field = value.find(key);
  if (!field) {
    return;
  }
  if (!field->isArray()) {
    throw FieldError{key, "an array of strings"};
  }
  out.clear();
  for (size_t i = 0; i < field->size(); ++i) {
    auto item = field->at(i);
    if (!item.isString()) {
      throw FieldError{key, "an array of strings"};
    }
    out.push_back(item.getString());
  }
}

json::JsonValue stringArray(const std::vector<std::string>& values) {
  json::JsonArrayBuilder builder;
  for (const auto& v : values) {
    builder.add(v);
  }
  return builder.build();
}

}  // namespace

Result<FilterSettings> FilterSettings::fromJson(const json::JsonValue& value) {
  if (!value.isObject()) {
    return makeError<FilterSettings>(errors::kInvalidConfig,
                                     "filter settings must be an object");
  }

  FilterSettings settings;
  try {
    readStrings(value, "blocked_domains", settings.blocked_domains);
    readStrings(value, "blocked_keywords", settings.blocked_keywords);
    readStrings(value, "blocked_patterns", settings.blocked_patterns);

    readBool(value, "remove_scripts", settings.remove_scripts);
    readBool(value, "remove_tracking", settings.remove_tracking);
    readBool(value, "remove_ads", settings.remove_ads);
    readBool(value, "normalize_whitespace", settings.normalize_whitespace);

    readBool(value, "redact_emails", settings.redact_emails);
    readBool(value, "redact_phones", settings.redact_phones);
    readBool(value, "redact_ssns", settings.redact_ssns);
    readBool(value, "redact_credit_cards", settings.redact_credit_cards);

    readSize(value, "max_response_length", settings.max_response_length);
    readSize(value, "summarize_threshold", settings.summarize_threshold);
    readSize(value, "summarize_min_length", settings.summarize_min_length);

    readBool(value, "enable_caching", settings.enable_caching);
    size_t ttl = static_cast<size_t>(settings.cache_ttl.count());
    readSize(value, "cache_ttl", ttl);
    settings.cache_ttl = std::chrono::seconds(ttl);
    readSize(value, "cache_max_entries", settings.cache_max_entries);

    readSize(value, "max_depth", settings.max_depth);
    if (settings.max_depth == 0) {
      throw FieldError{"max_depth", "a positive integer"};
    }

    readBool(value, "log_blocked_content", settings.log_blocked_content);
    readBool(value, "log_pii_redactions", settings.log_pii_redactions);
    readBool(value, "log_response_summaries",
             settings.log_response_summaries);

    if (auto rate = value.find("rate_limit")) {
      if (!rate->isObject()) {
        throw FieldError{"rate_limit", "an object"};
      }
      if (auto rps = rate->find("requests_per_second")) {
        if (!rps->isNumber() || rps->getFloat() <= 0.0) {
          throw FieldError{"rate_limit.requests_per_second",
                           "a positive number"};
        }
        settings.rate_limit.requests_per_second = rps->getFloat();
      }
      readSize(*rate, "burst", settings.rate_limit.burst);
    }

    if (auto filters = value.find("filters")) {
      if (!filters->isObject()) {
        throw FieldError{"filters", "an object of name: bool"};
      }
      for (const auto& name : filters->keys()) {
        bool enabled = true;
        readBool(*filters, name, enabled);
        settings.filters[name] = enabled;
      }
    }
  } catch (const FieldError& e) {
    return makeError<FilterSettings>(
        errors::kInvalidConfig,
        fmt::format("filter setting '{}' must be {}", e.key, e.expected));
  }
  return settings;
}

json::JsonValue FilterSettings::toJson() const {
  json::JsonObjectBuilder enabled;
  for (const auto& entry : filters) {
    enabled.add(entry.first, entry.second);
  }

  return json::JsonObjectBuilder()
      .add("blocked_domains", stringArray(blocked_domains))
      .add("blocked_keywords", stringArray(blocked_keywords))
      .add("blocked_patterns", stringArray(blocked_patterns))
      .add("remove_scripts", remove_scripts)
      .add("remove_tracking", remove_tracking)
      .add("remove_ads", remove_ads)
      .add("normalize_whitespace", normalize_whitespace)
      .add("redact_emails", redact_emails)
      .add("redact_phones", redact_phones)
      .add("redact_ssns", redact_ssns)
      .add("redact_credit_cards", redact_credit_cards)
      .add("max_response_length", static_cast<uint64_t>(max_response_length))
      .add("summarize_threshold", static_cast<uint64_t>(summarize_threshold))
      .add("summarize_min_length",
           static_cast<uint64_t>(summarize_min_length))
      .add("enable_caching", enable_caching)
      .add("cache_ttl", static_cast<int64_t>(cache_ttl.count()))
      .add("cache_max_entries", static_cast<uint64_t>(cache_max_entries))
      .add("max_depth", static_cast<uint64_t>(max_depth))
      .add("log_blocked_content", log_blocked_content)
      .add("log_pii_redactions", log_pii_redactions)
      .add("log_response_summaries", log_response_summaries)
      .add("rate_limit",
           json::JsonObjectBuilder()
               .add("requests_per_second", rate_limit.requests_per_second)
               .add("burst", static_cast<uint64_t>(rate_limit.burst))
               .build())
      .add("filters", enabled.build())
      .build();
}

FilterConfig::FilterConfig(const FilterSettings& settings, uint64_t version)
    : settings_(settings), version_(version) {
  for (const auto& pattern : settings_.blocked_patterns) {
    try {
      blocked_patterns_.emplace_back(
          pattern, std::regex::ECMAScript | std::regex::icase);
      blocked_pattern_sources_.push_back(pattern);
    } catch (const std::regex_error& e) {
      RELAY_LOG(Warning, "ignoring invalid blocked pattern '{}': {}", pattern,
                e.what());
    }
  }
}

bool FilterConfig::isEnabled(const std::string& filter_name,
                             bool default_enabled) const {
  auto it = settings_.filters.find(filter_name);
  if (it == settings_.filters.end()) {
    return default_enabled;
  }
  return it->second;
}

}  // namespace filter
}  // namespace relay
