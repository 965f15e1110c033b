#include "relay/broker/correlation_table.h"

namespace relay {
namespace broker {

bool CorrelationTable::record(const json::JsonValue& id,
                              const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = entries_[keyFor(id)];
  bool replaced = !entry.session_id.empty();
  entry.session_id = session_id;
  entry.sent_at = Clock::now();
  return replaced;
}

optional<std::string> CorrelationTable::resolve(const json::JsonValue& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(keyFor(id));
  if (it == entries_.end()) {
    return nullopt;
  }
  std::string owner = std::move(it->second.session_id);
  entries_.erase(it);
  return owner;
}

bool CorrelationTable::contains(const json::JsonValue& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(keyFor(id)) > 0;
}

size_t CorrelationTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

size_t CorrelationTable::purge(
    std::chrono::milliseconds ttl,
    const std::function<bool(const std::string&)>& is_live) {
  auto now = Clock::now();
  size_t purged = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    bool expired = ttl.count() > 0 && now - it->second.sent_at > ttl;
    if (expired || (is_live && !is_live(it->second.session_id))) {
      it = entries_.erase(it);
      ++purged;
    } else {
      ++it;
    }
  }
  return purged;
}

void CorrelationTable::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

}  // namespace broker
}  // namespace relay
