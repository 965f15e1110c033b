#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "relay/core/compat.h"
#include "relay/json/json_bridge.h"

namespace relay {
namespace broker {

/**
 * Outstanding request id -> owning session. Ids are keyed by their JSON
 * text, so the string "1" and the number 1 are distinct requests.
 */
class CorrelationTable {
 public:
  using Clock = std::chrono::steady_clock;

  static std::string keyFor(const json::JsonValue& id) { return id.toString(); }

  // Records |id| for |session_id|. Returns true if it replaced a stale
  // owner.
  bool record(const json::JsonValue& id, const std::string& session_id);

  // Removes the entry and returns its owner
  optional<std::string> resolve(const json::JsonValue& id);

  bool contains(const json::JsonValue& id) const;
  size_t size() const;

  // Drops entries older than |ttl| (zero disables the age check) and
  // entries whose owner fails |is_live|. Returns the number dropped.
  size_t purge(std::chrono::milliseconds ttl,
               const std::function<bool(const std::string&)>& is_live);

  void clear();

 private:
  struct Entry {
    std::string session_id;
    Clock::time_point sent_at;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

}  // namespace broker
}  // namespace relay
