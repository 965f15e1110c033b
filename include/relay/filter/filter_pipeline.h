#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "relay/core/result.h"
#include "relay/filter/filter_cache.h"
#include "relay/filter/filter_config.h"
#include "relay/filter/filter_metrics.h"
#include "relay/filter/message_filter.h"

namespace relay {
namespace filter {

struct FilterInfo {
  std::string name;
  std::string description;
  bool enabled{false};
  std::vector<Direction> directions;
};

/**
 * @brief Ordered chain of named, toggleable message filters
 *
 * The filter list is fixed at construction; behavior is driven by the
 * current FilterConfig snapshot, which is replaced atomically. process()
 * loads the snapshot once, so every message is filtered under exactly one
 * config even while a swap is in progress.
 *
 * Cacheable filters run first. For process-to-client messages their
 * combined output is cached by content hash; the remaining filters
 * (session- or time-dependent) run on every delivery, cached or not.
 *
 * A filter throwing std::exception is a fault: the fault is logged and
 * counted, and the chain continues with the message as it was before that
 * filter ran.
 */
class FilterPipeline {
 public:
  FilterPipeline(std::vector<MessageFilterPtr> filters,
                 const FilterSettings& settings = FilterSettings());

  // rate_limiter, blacklist, html_sanitizer, pii_redactor, secret_masker,
  // response_size, metadata_stamper
  static std::vector<MessageFilterPtr> defaultFilters();
  static std::unique_ptr<FilterPipeline> createDefault(
      const FilterSettings& settings = FilterSettings());

  FilterPipeline(const FilterPipeline&) = delete;
  FilterPipeline& operator=(const FilterPipeline&) = delete;

  FilterResult process(Direction direction,
                       const std::string& session_id,
                       const json::JsonValue& message);

  FilterConfigPtr config() const;
  uint64_t configVersion() const { return config()->version(); }

  // Installs a new snapshot and invalidates the cache
  void replaceConfig(const FilterSettings& settings);

  // Derives a new snapshot with one filter's enablement flipped
  VoidResult setFilterEnabled(const std::string& name, bool enabled);

  std::vector<FilterInfo> listFilters() const;

  FilterMetricsSnapshot metrics() const;
  void resetMetrics();

 private:
  MessageFilter* findFilter(const std::string& name) const;
  void installConfig(const FilterSettings& settings);

  // Runs one filter on a copy; returns false when it blocked the message
  bool runFilter(MessageFilter& filter,
                 FilterContext& context,
                 FilterResult& result);

  const std::vector<MessageFilterPtr> filters_;

  // Serializes writers; readers use std::atomic_load
  std::mutex config_mutex_;
  std::shared_ptr<const FilterConfig> config_;
  uint64_t next_version_{1};

  FilterCache cache_;
  FilterMetrics metrics_;
};

}  // namespace filter
}  // namespace relay
