#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "relay/core/result.h"
#include "relay/json/json_bridge.h"

namespace relay {
namespace filter {

struct RateLimitSettings {
  double requests_per_second{10.0};
  size_t burst{20};
};

/**
 * Plain, editable filter settings. Parsed from the `filters` section of the
 * bridge configuration or from a replace-config request, then frozen into
 * a FilterConfig snapshot.
 */
struct FilterSettings {
  // Blacklist
  std::vector<std::string> blocked_domains;
  std::vector<std::string> blocked_keywords;
  std::vector<std::string> blocked_patterns;

  // HTML sanitization
  bool remove_scripts{true};
  bool remove_tracking{true};
  bool remove_ads{true};
  bool normalize_whitespace{true};

  // PII redaction
  bool redact_emails{true};
  bool redact_phones{true};
  bool redact_ssns{true};
  bool redact_credit_cards{true};

  // Response size management (lengths in code points)
  size_t max_response_length{15000};
  size_t summarize_threshold{5000};
  size_t summarize_min_length{500};

  // Cache
  bool enable_caching{true};
  std::chrono::seconds cache_ttl{300};
  size_t cache_max_entries{1000};

  size_t max_depth{64};

  // Audit logging
  bool log_blocked_content{true};
  bool log_pii_redactions{true};
  bool log_response_summaries{true};

  RateLimitSettings rate_limit;

  // Per-filter enablement overrides, keyed by filter name
  std::map<std::string, bool> filters;

  // Unknown keys are ignored; wrong types fail with kInvalidConfig
  static Result<FilterSettings> fromJson(const json::JsonValue& value);
  json::JsonValue toJson() const;
};

/**
 * @brief Immutable, versioned snapshot of FilterSettings
 *
 * Every message is filtered against exactly one snapshot. Blocked patterns
 * are compiled once here; invalid ones are logged and skipped.
 */
class FilterConfig {
 public:
  FilterConfig(const FilterSettings& settings, uint64_t version);

  const FilterSettings& settings() const { return settings_; }
  uint64_t version() const { return version_; }

  const std::vector<std::regex>& blockedPatterns() const {
    return blocked_patterns_;
  }
  // Source text of blockedPatterns(), index-aligned
  const std::vector<std::string>& blockedPatternSources() const {
    return blocked_pattern_sources_;
  }

  bool isEnabled(const std::string& filter_name, bool default_enabled) const;

 private:
  const FilterSettings settings_;
  const uint64_t version_;
  std::vector<std::regex> blocked_patterns_;
  std::vector<std::string> blocked_pattern_sources_;
};

using FilterConfigPtr = std::shared_ptr<const FilterConfig>;

}  // namespace filter
}  // namespace relay
