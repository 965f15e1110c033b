#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "relay/json/json_bridge.h"

namespace relay {
namespace filter {

// What the cacheable filters produced for one message
struct CachedFilterResult {
  json::JsonValue message;
  std::vector<std::string> actions;
  std::map<std::string, uint64_t> redactions;
};

/**
 * @brief TTL cache of filtered process-to-client messages
 *
 * Keyed by SHA-256 of the message's canonical text. Every entry is tagged
 * with the config version it was produced under; a lookup under any other
 * version misses, so results computed against a replaced snapshot can
 * never be served even if they are inserted after the swap. Actions and
 * redaction counts are stored with the message so a hit reports the same
 * work as the miss that filled it.
 */
class FilterCache {
 public:
  using Clock = std::chrono::steady_clock;

  static std::string keyFor(const json::JsonValue& message);

  bool lookup(const std::string& key,
              uint64_t version,
              std::chrono::seconds ttl,
              CachedFilterResult& out);

  // Past |max_entries| the oldest tenth is evicted
  void insert(const std::string& key,
              uint64_t version,
              const CachedFilterResult& result,
              size_t max_entries);

  void clear();
  size_t size() const;

 private:
  struct Entry {
    CachedFilterResult result;
    uint64_t version;
    Clock::time_point inserted_at;
  };

  void evictOldest(size_t count);

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

}  // namespace filter
}  // namespace relay
