#include "relay/session/session_registry.h"

#include "relay/core/crypto_utils.h"
#include "relay/core/error_codes.h"

#define RELAY_LOG_COMPONENT "session.registry"
#include "relay/logging/log_macros.h"

namespace relay {
namespace session {

namespace {

constexpr size_t kSessionIdBytes = 16;

Error notFound(const std::string& id) {
  return Error(errors::kSessionNotFound, "session not found: " + id);
}

}  // namespace

SessionRegistry::SessionRegistry(const SessionConfig& config)
    : config_(config) {}

std::string SessionRegistry::create() {
  std::string id = crypto::randomHex(kSessionIdBytes);
  auto session = std::make_shared<Session>(id, config_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[id] = session;
  }
  RELAY_LOG(Info, "session {} registered", id);
  return id;
}

SessionPtr SessionRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

Result<SessionPtr> SessionRegistry::get(const std::string& id) const {
  auto session = find(id);
  if (!session) {
    return makeError<SessionPtr>(notFound(id));
  }
  return session;
}

bool SessionRegistry::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(id) > 0;
}

VoidResult SessionRegistry::remove(const std::string& id) {
  SessionPtr session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      return makeVoidError(notFound(id));
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }
  session->close();
  RELAY_LOG(Info, "session {} removed", id);
  return makeVoidSuccess();
}

void SessionRegistry::removeAll() {
  std::map<std::string, SessionPtr> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.swap(sessions_);
  }
  for (auto& entry : sessions) {
    entry.second->close();
  }
}

DeliveryStatus SessionRegistry::deliver(const std::string& id,
                                        const json::JsonValue& frame) {
  auto session = find(id);
  if (!session) {
    return DeliveryStatus::Closed;
  }
  return session->deliver(frame);
}

Result<OutboundFrame> SessionRegistry::nextFrame(const std::string& id) {
  return nextFrame(id, config_.heartbeat_interval);
}

Result<OutboundFrame> SessionRegistry::nextFrame(
    const std::string& id, std::chrono::milliseconds timeout) {
  auto session = find(id);
  if (!session) {
    return makeError<OutboundFrame>(notFound(id));
  }

  OutboundFrame frame;
  switch (session->nextFrame(frame.message, timeout)) {
    case PullStatus::Frame:
      return frame;
    case PullStatus::Heartbeat:
      frame.heartbeat = true;
      return frame;
    case PullStatus::Closed:
      break;
  }
  return makeError<OutboundFrame>(notFound(id));
}

Result<SubscriberId> SessionRegistry::attachSubscriber(
    const std::string& id, SubscriberPtr subscriber) {
  auto session = find(id);
  if (!session) {
    return makeError<SubscriberId>(notFound(id));
  }
  session->touch();
  return session->attachSubscriber(std::move(subscriber));
}

VoidResult SessionRegistry::detachSubscriber(const std::string& id,
                                             SubscriberId subscriber_id) {
  auto session = find(id);
  if (!session) {
    return makeVoidError(notFound(id));
  }
  if (!session->detachSubscriber(subscriber_id)) {
    return makeVoidError(
        Error(errors::kSessionNotFound,
              "subscriber " + std::to_string(subscriber_id) +
                  " not attached to session " + id));
  }
  return makeVoidSuccess();
}

VoidResult SessionRegistry::touch(const std::string& id) {
  auto session = find(id);
  if (!session) {
    return makeVoidError(notFound(id));
  }
  session->touch();
  return makeVoidSuccess();
}

VoidResult SessionRegistry::recordBlocked(const std::string& id) {
  auto session = find(id);
  if (!session) {
    return makeVoidError(notFound(id));
  }
  session->recordBlocked();
  return makeVoidSuccess();
}

std::vector<std::string> SessionRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    result.push_back(entry.first);
  }
  return result;
}

std::vector<SessionInfo> SessionRegistry::list() const {
  std::vector<SessionPtr> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : sessions_) {
      sessions.push_back(entry.second);
    }
  }
  std::vector<SessionInfo> result;
  result.reserve(sessions.size());
  for (const auto& session : sessions) {
    result.push_back(session->info());
  }
  return result;
}

Result<SessionInfo> SessionRegistry::info(const std::string& id) const {
  auto session = find(id);
  if (!session) {
    return makeError<SessionInfo>(notFound(id));
  }
  return session->info();
}

size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> SessionRegistry::sweepIdle(
    std::chrono::milliseconds max_age) {
  std::vector<SessionPtr> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second->idleAge() > max_age) {
        expired.push_back(std::move(it->second));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::vector<std::string> removed;
  for (auto& session : expired) {
    session->close();
    removed.push_back(session->id());
    RELAY_LOG(Info, "session {} expired after {}ms idle", session->id(),
              session->idleAge().count());
  }
  return removed;
}

}  // namespace session
}  // namespace relay
