#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "relay/core/result.h"
#include "relay/session/session.h"

namespace relay {
namespace session {

/**
 * @brief Id-keyed arena of sessions
 *
 * Sessions exist only in this map. Everything else addresses them by id,
 * so a removed session simply stops being reachable; an operation that
 * races with removal sees kSessionNotFound or DeliveryStatus::Closed.
 */
class SessionRegistry {
 public:
  explicit SessionRegistry(const SessionConfig& config = SessionConfig());

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Returns the new session's id (128 random bits, hex)
  std::string create();

  Result<SessionPtr> get(const std::string& id) const;
  bool contains(const std::string& id) const;

  VoidResult remove(const std::string& id);
  void removeAll();

  DeliveryStatus deliver(const std::string& id, const json::JsonValue& frame);

  // Delivery-sink primitive. Waits for a frame for at most the heartbeat
  // interval and returns a heartbeat marker when none arrived.
  Result<OutboundFrame> nextFrame(const std::string& id);
  Result<OutboundFrame> nextFrame(const std::string& id,
                                  std::chrono::milliseconds timeout);

  Result<SubscriberId> attachSubscriber(const std::string& id,
                                        SubscriberPtr subscriber);
  VoidResult detachSubscriber(const std::string& id,
                              SubscriberId subscriber_id);

  VoidResult touch(const std::string& id);
  VoidResult recordBlocked(const std::string& id);

  std::vector<std::string> ids() const;
  std::vector<SessionInfo> list() const;
  Result<SessionInfo> info(const std::string& id) const;
  size_t size() const;

  // Removes sessions idle longer than |max_age|; returns their ids
  std::vector<std::string> sweepIdle(std::chrono::milliseconds max_age);

  const SessionConfig& config() const { return config_; }

 private:
  SessionPtr find(const std::string& id) const;

  const SessionConfig config_;
  mutable std::mutex mutex_;
  std::map<std::string, SessionPtr> sessions_;
};

}  // namespace session
}  // namespace relay
