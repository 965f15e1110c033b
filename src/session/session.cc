#include "relay/session/session.h"

#include <vector>

#define RELAY_LOG_COMPONENT "session"
#include "relay/logging/log_macros.h"

namespace relay {
namespace session {

Session::Session(const std::string& id, const SessionConfig& config)
    : id_(id),
      created_at_(Clock::now()),
      last_activity_(created_at_.time_since_epoch().count()),
      queue_(config.queue_capacity) {}

DeliveryStatus Session::deliver(const json::JsonValue& frame) {
  if (queue_.closed()) {
    return DeliveryStatus::Closed;
  }

  // Tee to live subscribers; a failed send prunes that subscriber
  std::vector<std::pair<SubscriberId, SubscriberPtr>> targets;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    targets.assign(subscribers_.begin(), subscribers_.end());
  }
  for (const auto& target : targets) {
    if (!target.second->send(frame)) {
      RELAY_LOG(Debug, "session {} pruned disconnected subscriber {}", id_,
                target.first);
      std::lock_guard<std::mutex> lock(subscribers_mutex_);
      subscribers_.erase(target.first);
    }
  }

  if (!queue_.tryPush(frame)) {
    if (queue_.closed()) {
      return DeliveryStatus::Closed;
    }
    dropped_messages_++;
    logging::LogContext ctx;
    ctx.session_id = id_;
    RELAY_LOG_WITH_CONTEXT(Warning, ctx,
                           "outbound queue full ({} frames); dropping message",
                           queue_.capacity());
    return DeliveryStatus::Dropped;
  }
  messages_delivered_++;
  return DeliveryStatus::Queued;
}

PullStatus Session::nextFrame(json::JsonValue& out,
                              std::chrono::milliseconds timeout) {
  touch();
  auto status = queue_.popFor(out, timeout);
  touch();
  switch (status) {
    case BlockingQueue<json::JsonValue>::PopStatus::Ok:
      return PullStatus::Frame;
    case BlockingQueue<json::JsonValue>::PopStatus::Timeout:
      return PullStatus::Heartbeat;
    case BlockingQueue<json::JsonValue>::PopStatus::Closed:
      break;
  }
  return PullStatus::Closed;
}

SubscriberId Session::attachSubscriber(SubscriberPtr subscriber) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  SubscriberId subscriber_id = next_subscriber_id_++;
  subscribers_[subscriber_id] = std::move(subscriber);
  return subscriber_id;
}

bool Session::detachSubscriber(SubscriberId subscriber_id) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  return subscribers_.erase(subscriber_id) > 0;
}

void Session::touch() {
  last_activity_.store(Clock::now().time_since_epoch().count());
}

void Session::close() {
  queue_.close();
  size_t dropped = queue_.clear();
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.clear();
  }
  if (dropped > 0) {
    RELAY_LOG(Debug, "session {} closed with {} undelivered frames", id_,
              dropped);
  }
}

std::chrono::milliseconds Session::idleAge() const {
  Clock::time_point last{Clock::duration(last_activity_.load())};
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               last);
}

SessionInfo Session::info() const {
  SessionInfo info;
  info.id = id_;
  info.queue_depth = queue_.size();
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    info.subscriber_count = subscribers_.size();
  }
  info.idle_age = idleAge();
  info.age = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - created_at_);
  info.messages_delivered = messages_delivered_.load();
  info.dropped_messages = dropped_messages_.load();
  info.blocked_messages = blocked_messages_.load();
  return info;
}

}  // namespace session
}  // namespace relay
