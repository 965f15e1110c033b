#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "relay/filter/message_filter.h"
#include "relay/json/json_bridge.h"

namespace relay {
namespace filter {

struct PerFilterStats {
  uint64_t invocations{0};
  uint64_t modifications{0};
  uint64_t blocks{0};
  uint64_t faults{0};
};

// Point-in-time copy handed to the control surface
struct FilterMetricsSnapshot {
  uint64_t total_messages{0};
  uint64_t client_to_server{0};
  uint64_t server_to_client{0};
  uint64_t blocked{0};
  uint64_t pii_redactions{0};
  uint64_t secrets_masked{0};
  uint64_t sanitizations{0};
  uint64_t summaries{0};
  uint64_t truncations{0};
  uint64_t rate_limited{0};
  uint64_t filter_faults{0};
  uint64_t cache_hits{0};
  uint64_t cache_misses{0};
  size_t cache_size{0};
  double avg_processing_ms{0.0};
  std::map<std::string, uint64_t> redactions_by_kind;
  std::map<std::string, PerFilterStats> per_filter;

  double cacheHitRate() const {
    uint64_t lookups = cache_hits + cache_misses;
    return lookups == 0 ? 0.0 : static_cast<double>(cache_hits) / lookups;
  }

  json::JsonValue toJson() const;
};

class FilterMetrics {
 public:
  void recordMessage(Direction direction);
  void recordResult(const FilterResult& result,
                    std::chrono::nanoseconds elapsed);
  void recordFilter(const std::string& name,
                    bool modified,
                    bool blocked,
                    bool faulted);
  void recordCacheHit() { cache_hits_++; }
  void recordCacheMiss() { cache_misses_++; }

  FilterMetricsSnapshot snapshot(size_t cache_size) const;
  void reset();

 private:
  std::atomic<uint64_t> total_messages_{0};
  std::atomic<uint64_t> client_to_server_{0};
  std::atomic<uint64_t> server_to_client_{0};
  std::atomic<uint64_t> blocked_{0};
  std::atomic<uint64_t> sanitizations_{0};
  std::atomic<uint64_t> summaries_{0};
  std::atomic<uint64_t> truncations_{0};
  std::atomic<uint64_t> rate_limited_{0};
  std::atomic<uint64_t> filter_faults_{0};
  std::atomic<uint64_t> cache_hits_{0};
  std::atomic<uint64_t> cache_misses_{0};
  std::atomic<uint64_t> total_processing_ns_{0};
  std::atomic<uint64_t> timed_messages_{0};

  mutable std::mutex mutex_;
  std::map<std::string, uint64_t> redactions_by_kind_;
  std::map<std::string, PerFilterStats> per_filter_;
};

}  // namespace filter
}  // namespace relay
