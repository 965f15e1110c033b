#include "relay/filter/filter_cache.h"

#include <algorithm>
#include <vector>

#include "relay/core/crypto_utils.h"

namespace relay {
namespace filter {

std::string FilterCache::keyFor(const json::JsonValue& message) {
  // Object keys serialize sorted, so equal messages give equal text
  return crypto::sha256Hex(message.toString());
}

bool FilterCache::lookup(const std::string& key,
                         uint64_t version,
                         std::chrono::seconds ttl,
                         CachedFilterResult& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  if (it->second.version != version ||
      Clock::now() - it->second.inserted_at > ttl) {
    entries_.erase(it);
    return false;
  }
  out = it->second.result;
  return true;
}

void FilterCache::insert(const std::string& key,
                         uint64_t version,
                         const CachedFilterResult& result,
                         size_t max_entries) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = Entry{result, version, Clock::now()};
  if (entries_.size() > max_entries) {
    evictOldest(std::max<size_t>(1, max_entries / 10));
  }
}

void FilterCache::evictOldest(size_t count) {
  std::vector<std::pair<Clock::time_point, std::string>> by_age;
  by_age.reserve(entries_.size());
  for (const auto& entry : entries_) {
    by_age.emplace_back(entry.second.inserted_at, entry.first);
  }
  count = std::min(count, by_age.size());
  std::partial_sort(by_age.begin(), by_age.begin() + count, by_age.end());
  for (size_t i = 0; i < count; ++i) {
    entries_.erase(by_age[i].second);
  }
}

void FilterCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

size_t FilterCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace filter
}  // namespace relay
