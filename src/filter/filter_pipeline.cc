#include "relay/filter/filter_pipeline.h"

#include <chrono>

#include "relay/core/error_codes.h"
#include "relay/filter/blacklist_filter.h"
#include "relay/filter/html_sanitizer_filter.h"
#include "relay/filter/metadata_filter.h"
#include "relay/filter/pii_redaction_filter.h"
#include "relay/filter/rate_limit_filter.h"
#include "relay/filter/response_size_filter.h"
#include "relay/filter/secret_mask_filter.h"

#define RELAY_LOG_COMPONENT "filter.pipeline"
#include "relay/logging/log_macros.h"

namespace relay {
namespace filter {

FilterPipeline::FilterPipeline(std::vector<MessageFilterPtr> filters,
                               const FilterSettings& settings)
    : filters_(std::move(filters)) {
  installConfig(settings);
}

std::vector<MessageFilterPtr> FilterPipeline::defaultFilters() {
  std::vector<MessageFilterPtr> filters;
  filters.push_back(std::make_unique<RateLimitFilter>());
  filters.push_back(std::make_unique<BlacklistFilter>());
  filters.push_back(std::make_unique<HtmlSanitizerFilter>());
  filters.push_back(std::make_unique<PiiRedactionFilter>());
  filters.push_back(std::make_unique<SecretMaskFilter>());
  filters.push_back(std::make_unique<ResponseSizeFilter>());
  filters.push_back(std::make_unique<MetadataFilter>());
  return filters;
}

std::unique_ptr<FilterPipeline> FilterPipeline::createDefault(
    const FilterSettings& settings) {
  return std::make_unique<FilterPipeline>(defaultFilters(), settings);
}

FilterConfigPtr FilterPipeline::config() const {
  return std::atomic_load(&config_);
}

void FilterPipeline::installConfig(const FilterSettings& settings) {
  auto next = std::make_shared<const FilterConfig>(settings, next_version_++);
  std::atomic_store(&config_, next);
  cache_.clear();
  RELAY_LOG(Info, "filter config version {} installed", next->version());
}

void FilterPipeline::replaceConfig(const FilterSettings& settings) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  installConfig(settings);
}

VoidResult FilterPipeline::setFilterEnabled(const std::string& name,
                                            bool enabled) {
  if (!findFilter(name)) {
    return makeVoidError(
        Error(errors::kFilterNotFound, "unknown filter: " + name));
  }
  std::lock_guard<std::mutex> lock(config_mutex_);
  FilterSettings settings = std::atomic_load(&config_)->settings();
  settings.filters[name] = enabled;
  installConfig(settings);
  RELAY_LOG(Info, "filter '{}' {}", name, enabled ? "enabled" : "disabled");
  return makeVoidSuccess();
}

MessageFilter* FilterPipeline::findFilter(const std::string& name) const {
  for (const auto& filter : filters_) {
    if (filter->name() == name) {
      return filter.get();
    }
  }
  return nullptr;
}

std::vector<FilterInfo> FilterPipeline::listFilters() const {
  auto snapshot = config();
  std::vector<FilterInfo> result;
  for (const auto& filter : filters_) {
    FilterInfo info;
    info.name = filter->name();
    info.description = filter->description();
    info.enabled =
        snapshot->isEnabled(filter->name(), filter->enabledByDefault());
    for (Direction direction :
         {Direction::ClientToServer, Direction::ServerToClient}) {
      if (filter->appliesTo(direction)) {
        info.directions.push_back(direction);
      }
    }
    result.push_back(std::move(info));
  }
  return result;
}

FilterMetricsSnapshot FilterPipeline::metrics() const {
  return metrics_.snapshot(cache_.size());
}

void FilterPipeline::resetMetrics() { metrics_.reset(); }

FilterResult FilterPipeline::process(Direction direction,
                                     const std::string& session_id,
                                     const json::JsonValue& message) {
  auto started = std::chrono::steady_clock::now();
  auto snapshot = config();
  const FilterSettings& settings = snapshot->settings();

  FilterResult result;
  result.message = message;
  result.config_version = snapshot->version();
  metrics_.recordMessage(direction);

  FilterContext context(direction, session_id, snapshot);

  auto active = [&](const MessageFilter& filter) {
    return filter.appliesTo(direction) &&
           snapshot->isEnabled(filter.name(), filter.enabledByDefault());
  };

  bool use_cache =
      direction == Direction::ServerToClient && settings.enable_caching;
  std::string cache_key;
  if (use_cache) {
    try {
      cache_key = FilterCache::keyFor(message);
    } catch (const std::runtime_error& e) {
      RELAY_LOG(Warning, "cache bypassed, cannot hash message: {}", e.what());
      use_cache = false;
    }
  }

  if (!use_cache) {
    for (const auto& filter : filters_) {
      if (active(*filter) && !runFilter(*filter, context, result)) {
        break;
      }
    }
  } else {
    // Cacheable filters run before the cache, the rest after it
    bool blocked = false;
    CachedFilterResult cached;
    if (cache_.lookup(cache_key, snapshot->version(), settings.cache_ttl,
                      cached)) {
      result.from_cache = true;
      result.message = std::move(cached.message);
      for (const auto& action : cached.actions) {
        context.recordAction(action);
      }
      for (const auto& entry : cached.redactions) {
        context.addRedactions(entry.first, entry.second);
      }
      context.recordAction(actions::kCacheHit);
      metrics_.recordCacheHit();
    } else {
      metrics_.recordCacheMiss();
      for (const auto& filter : filters_) {
        if (filter->cacheable() && active(*filter) &&
            !runFilter(*filter, context, result)) {
          blocked = true;
          break;
        }
      }
      if (!blocked) {
        cache_.insert(cache_key, snapshot->version(),
                      CachedFilterResult{result.message, context.actions(),
                                         context.redactions()},
                      settings.cache_max_entries);
      }
    }

    if (!blocked) {
      for (const auto& filter : filters_) {
        if (!filter->cacheable() && active(*filter) &&
            !runFilter(*filter, context, result)) {
          break;
        }
      }
    }
  }

  result.actions_taken = context.actions();
  result.redaction_counts = context.redactions();
  metrics_.recordResult(result, std::chrono::steady_clock::now() - started);
  return result;
}

bool FilterPipeline::runFilter(MessageFilter& filter,
                               FilterContext& context,
                               FilterResult& result) {
  auto checkpoint = context.checkpoint();
  json::JsonValue working = result.message;
  FilterStatus status = FilterStatus::Continue;

  try {
    status = filter.apply(context, working);
  } catch (const std::exception& e) {
    context.restore(checkpoint);
    metrics_.recordFilter(filter.name(), false, false, true);
    logging::LogContext ctx;
    ctx.session_id = context.sessionId();
    ctx.direction = directionToString(context.direction());
    ctx.filter_name = filter.name();
    RELAY_LOG_WITH_CONTEXT(Error, ctx, "filter fault, passing through: {}",
                           e.what());
    return true;
  }

  if (status == FilterStatus::StopIteration || context.blocked()) {
    result.blocked = true;
    result.blocked_by = filter.name();
    result.block_reason = context.blockReason().empty()
                              ? "blocked by " + filter.name()
                              : context.blockReason();
    metrics_.recordFilter(filter.name(), false, true, false);
    return false;
  }

  bool modified = context.actions().size() > checkpoint.action_count;
  metrics_.recordFilter(filter.name(), modified, false, false);
  result.message = std::move(working);
  return true;
}

}  // namespace filter
}  // namespace relay
