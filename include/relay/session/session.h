#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "relay/core/blocking_queue.h"
#include "relay/json/json_bridge.h"

namespace relay {
namespace session {

/**
 * Live stream handle owned by the outer transport (event stream, socket).
 * send() returning false marks the handle as disconnected; it is pruned
 * on that send and never probed otherwise.
 */
class Subscriber {
 public:
  virtual ~Subscriber() = default;

  virtual bool send(const json::JsonValue& frame) = 0;
};

using SubscriberPtr = std::shared_ptr<Subscriber>;
using SubscriberId = uint64_t;

struct SessionConfig {
  size_t queue_capacity{100};
  std::chrono::milliseconds heartbeat_interval{15000};
  std::chrono::milliseconds max_idle{300000};
  std::chrono::milliseconds sweep_interval{30000};
};

struct SessionInfo {
  std::string id;
  size_t queue_depth{0};
  size_t subscriber_count{0};
  std::chrono::milliseconds idle_age{0};
  std::chrono::milliseconds age{0};
  uint64_t messages_delivered{0};
  uint64_t dropped_messages{0};
  uint64_t blocked_messages{0};
};

// What the delivery sink hands to the transport: a frame, or a heartbeat
// when nothing arrived within the heartbeat interval.
struct OutboundFrame {
  bool heartbeat{false};
  json::JsonValue message;
};

enum class DeliveryStatus { Queued, Dropped, Closed };

enum class PullStatus { Frame, Heartbeat, Closed };

/**
 * @brief One logical client connection
 *
 * Holds the bounded outbound queue and the subscriber set. A delivered
 * frame goes onto the queue and is teed to every live subscriber. A full
 * queue drops the newest frame; delivery never blocks.
 */
class Session {
 public:
  Session(const std::string& id, const SessionConfig& config);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const std::string& id() const { return id_; }

  DeliveryStatus deliver(const json::JsonValue& frame);

  // Waits up to |timeout| for the next queued frame. Refreshes activity.
  PullStatus nextFrame(json::JsonValue& out, std::chrono::milliseconds timeout);

  SubscriberId attachSubscriber(SubscriberPtr subscriber);
  bool detachSubscriber(SubscriberId subscriber_id);

  void touch();
  void recordBlocked() { blocked_messages_++; }

  // Drops queued frames, detaches subscribers and wakes pullers
  void close();
  bool closed() const { return queue_.closed(); }

  std::chrono::milliseconds idleAge() const;
  SessionInfo info() const;

 private:
  using Clock = std::chrono::steady_clock;

  const std::string id_;
  const Clock::time_point created_at_;
  std::atomic<Clock::rep> last_activity_;

  BlockingQueue<json::JsonValue> queue_;

  mutable std::mutex subscribers_mutex_;
  std::map<SubscriberId, SubscriberPtr> subscribers_;
  SubscriberId next_subscriber_id_{1};

  std::atomic<uint64_t> messages_delivered_{0};
  std::atomic<uint64_t> dropped_messages_{0};
  std::atomic<uint64_t> blocked_messages_{0};
};

using SessionPtr = std::shared_ptr<Session>;

}  // namespace session
}  // namespace relay
