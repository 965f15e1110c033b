#include "relay/filter/filter_metrics.h"

namespace relay {
namespace filter {

json::JsonValue FilterMetricsSnapshot::toJson() const {
  json::JsonObjectBuilder redactions;
  for (const auto& entry : redactions_by_kind) {
    redactions.add(entry.first, entry.second);
  }
  json::JsonObjectBuilder filters;
  for (const auto& entry : per_filter) {
    filters.add(entry.first,
                json::JsonObjectBuilder()
                    .add("invocations", entry.second.invocations)
                    .add("modifications", entry.second.modifications)
                    .add("blocks", entry.second.blocks)
                    .add("faults", entry.second.faults)
                    .build());
  }

  return json::JsonObjectBuilder()
      .add("total_messages", total_messages)
      .add("client_to_server", client_to_server)
      .add("server_to_client", server_to_client)
      .add("blocked", blocked)
      .add("pii_redactions", pii_redactions)
      .add("secrets_masked", secrets_masked)
      .add("sanitizations", sanitizations)
      .add("summaries", summaries)
      .add("truncations", truncations)
      .add("rate_limited", rate_limited)
      .add("filter_faults", filter_faults)
      .add("cache_hits", cache_hits)
      .add("cache_misses", cache_misses)
      .add("cache_hit_rate", cacheHitRate())
      .add("cache_size", static_cast<uint64_t>(cache_size))
      .add("avg_processing_ms", avg_processing_ms)
      .add("redactions_by_kind", redactions.build())
      .add("filters", filters.build())
      .build();
}

void FilterMetrics::recordMessage(Direction direction) {
  total_messages_++;
  if (direction == Direction::ClientToServer) {
    client_to_server_++;
  } else {
    server_to_client_++;
  }
}

void FilterMetrics::recordResult(const FilterResult& result,
                                 std::chrono::nanoseconds elapsed) {
  total_processing_ns_ += static_cast<uint64_t>(elapsed.count());
  timed_messages_++;
  if (result.blocked) {
    blocked_++;
  }
  for (const auto& action : result.actions_taken) {
    if (action == actions::kSanitized) {
      sanitizations_++;
    } else if (action == actions::kSummarized) {
      summaries_++;
    } else if (action == actions::kTruncated) {
      truncations_++;
    } else if (action == actions::kRateLimited) {
      rate_limited_++;
    }
  }
  if (!result.redaction_counts.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : result.redaction_counts) {
      redactions_by_kind_[entry.first] += entry.second;
    }
  }
}

void FilterMetrics::recordFilter(const std::string& name,
                                 bool modified,
                                 bool blocked,
                                 bool faulted) {
  if (faulted) {
    filter_faults_++;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stats = per_filter_[name];
  stats.invocations++;
  if (modified) {
    stats.modifications++;
  }
  if (blocked) {
    stats.blocks++;
  }
  if (faulted) {
    stats.faults++;
  }
}

FilterMetricsSnapshot FilterMetrics::snapshot(size_t cache_size) const {
  FilterMetricsSnapshot snapshot;
  snapshot.total_messages = total_messages_.load();
  snapshot.client_to_server = client_to_server_.load();
  snapshot.server_to_client = server_to_client_.load();
  snapshot.blocked = blocked_.load();
  snapshot.sanitizations = sanitizations_.load();
  snapshot.summaries = summaries_.load();
  snapshot.truncations = truncations_.load();
  snapshot.rate_limited = rate_limited_.load();
  snapshot.filter_faults = filter_faults_.load();
  snapshot.cache_hits = cache_hits_.load();
  snapshot.cache_misses = cache_misses_.load();
  snapshot.cache_size = cache_size;

  uint64_t timed = timed_messages_.load();
  if (timed > 0) {
    snapshot.avg_processing_ms =
        static_cast<double>(total_processing_ns_.load()) / timed / 1e6;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  snapshot.redactions_by_kind = redactions_by_kind_;
  snapshot.per_filter = per_filter_;
  for (const auto& entry : redactions_by_kind_) {
    if (entry.first == "secret") {
      snapshot.secrets_masked += entry.second;
    } else {
      snapshot.pii_redactions += entry.second;
    }
  }
  return snapshot;
}

void FilterMetrics::reset() {
  total_messages_ = 0;
  client_to_server_ = 0;
  server_to_client_ = 0;
  blocked_ = 0;
  sanitizations_ = 0;
  summaries_ = 0;
  truncations_ = 0;
  rate_limited_ = 0;
  filter_faults_ = 0;
  cache_hits_ = 0;
  cache_misses_ = 0;
  total_processing_ns_ = 0;
  timed_messages_ = 0;

  std::lock_guard<std::mutex> lock(mutex_);
  redactions_by_kind_.clear();
  per_filter_.clear();
}

}  // namespace filter
}  // namespace relay
