#include "relay/broker/broker.h"

#include <fmt/format.h>

#include "relay/core/error_codes.h"
#include "relay/process/stdio_child_process.h"

#define RELAY_LOG_COMPONENT "broker"
#include "relay/logging/log_macros.h"

namespace relay {
namespace broker {

namespace {

bool startsWith(const std::string& text, const char* prefix) {
  return text.rfind(prefix, 0) == 0;
}

bool hasId(const json::JsonValue& message) {
  auto id = message.find("id");
  return id && !id->isNull();
}

}  // namespace

const char* bridgeStateToString(BridgeState state) {
  switch (state) {
    case BridgeState::Idle:
      return "idle";
    case BridgeState::Running:
      return "running";
    case BridgeState::Down:
      return "down";
    case BridgeState::Stopped:
      return "stopped";
  }
  return "unknown";
}

json::JsonValue BrokerStats::toJson() const {
  return json::JsonObjectBuilder()
      .add("submitted", submitted)
      .add("forwarded", forwarded)
      .add("blocked", blocked)
      .add("ids_assigned", ids_assigned)
      .add("responses_routed", responses_routed)
      .add("notifications_fanned_out", notifications_fanned_out)
      .add("orphans_broadcast", orphans_broadcast)
      .add("queue_full_drops", queue_full_drops)
      .add("permit_waits", permit_waits)
      .add("correlations_purged", correlations_purged)
      .add("in_flight", static_cast<uint64_t>(in_flight))
      .add("pending_requests", static_cast<uint64_t>(pending_requests))
      .build();
}

Broker::Broker(const BrokerConfig& config,
               process::ProcessEndpoint& endpoint,
               session::SessionRegistry& registry,
               filter::FilterPipeline& pipeline)
    : config_(config),
      endpoint_(endpoint),
      registry_(registry),
      pipeline_(pipeline),
      gate_(config.max_in_flight, config.permit_poll_interval) {}

Broker::~Broker() { stop(); }

void Broker::start() {
  if (pump_thread_.joinable()) {
    return;
  }
  stopping_ = false;
  state_ = BridgeState::Running;
  pump_thread_ = std::thread([this]() { pumpLoop(); });
  RELAY_LOG(Info, "broker started (max in-flight {})", gate_.capacity());
}

void Broker::stop() {
  stopping_ = true;
  if (pump_thread_.joinable()) {
    pump_thread_.join();
  }
  BridgeState expected = BridgeState::Running;
  state_.compare_exchange_strong(expected, BridgeState::Stopped);
}

std::string Broker::downReason() const {
  std::lock_guard<std::mutex> lock(reason_mutex_);
  return down_reason_;
}

json::JsonValue Broker::nextRequestId() {
  ids_assigned_++;
  return json::JsonValue(fmt::format("relay-{}", next_id_++));
}

json::JsonValue Broker::blockedResponse(const json::JsonValue& id,
                                        const std::string& filter_name,
                                        const std::string& reason) {
  return json::JsonObjectBuilder()
      .add("jsonrpc", "2.0")
      .add("id", id)
      .add("error",
           json::JsonObjectBuilder()
               .add("code", jsonrpc::BLOCKED_BY_POLICY)
               .add("message", "Blocked by policy: " + reason)
               .add("data", json::JsonObjectBuilder()
                                .add("filter", filter_name)
                                .add("reason", reason)
                                .build())
               .build())
      .build();
}

json::JsonValue Broker::bridgeErrorEvent(const std::string& reason) {
  return json::JsonObjectBuilder()
      .add("type", "bridge/error")
      .add("error", reason)
      .build();
}

Result<SubmitOutcome> Broker::submit(const std::string& session_id,
                                     const json::JsonValue& message) {
  BridgeState current = state_.load();
  if (current == BridgeState::Down || current == BridgeState::Stopped) {
    return makeError<SubmitOutcome>(
        errors::kBridgeDown,
        fmt::format("bridge is {}: {}", bridgeStateToString(current),
                    downReason()));
  }

  auto touched = registry_.touch(session_id);
  if (isError(touched)) {
    return makeError<SubmitOutcome>(errorOf(touched));
  }
  if (!message.isObject()) {
    return makeError<SubmitOutcome>(jsonrpc::INVALID_REQUEST,
                                    "message must be a JSON object");
  }
  submitted_++;

  json::JsonValue outbound = message;
  if (!outbound.contains("jsonrpc")) {
    outbound.set("jsonrpc", "2.0");
  }

  // A method without an id expects a reply unless it is a notification
  auto method = outbound.find("method");
  if (!hasId(outbound) && method && method->isString() &&
      !startsWith(method->getString(), "notifications/")) {
    outbound.set("id", nextRequestId());
  }

  SubmitOutcome outcome;
  bool is_request = hasId(outbound);
  if (is_request) {
    outcome.id = outbound.at("id");
    if (correlation_.record(outcome.id, session_id)) {
      RELAY_LOG(Debug, "request id {} reassigned to session {}",
                outcome.id.toString(), session_id);
    }
  }

  auto filtered = pipeline_.process(filter::Direction::ClientToServer,
                                    session_id, outbound);
  if (filtered.blocked) {
    if (is_request) {
      correlation_.resolve(outcome.id);
    }
    blocked_++;
    auto recorded = registry_.recordBlocked(session_id);
    if (isError(recorded)) {
      RELAY_LOG(Debug, "blocked count not recorded: {}",
                errorOf(recorded).message);
    }
    registry_.deliver(session_id,
                      blockedResponse(outcome.id, filtered.blocked_by,
                                      filtered.block_reason));
    outcome.blocked = true;
    outcome.block_reason = filtered.block_reason;
    return outcome;
  }

  if (!gate_.acquire(&stopping_)) {
    if (is_request) {
      correlation_.resolve(outcome.id);
    }
    return makeError<SubmitOutcome>(errors::kBridgeDown, "bridge stopping");
  }
  VoidResult written = makeVoidSuccess();
  {
    PermitGuard permit(gate_);
    written = endpoint_.writeJSON(filtered.message);
  }
  if (isError(written)) {
    if (is_request) {
      correlation_.resolve(outcome.id);
    }
    logging::LogContext ctx;
    ctx.session_id = session_id;
    RELAY_LOG_WITH_CONTEXT(Error, ctx, "write to child failed: {}",
                           errorOf(written).message);
    return makeError<SubmitOutcome>(errorOf(written));
  }

  forwarded_++;
  outcome.forwarded = true;
  return outcome;
}

void Broker::pumpLoop() {
  while (!stopping_) {
    json::JsonValue message;
    auto status = endpoint_.nextMessage(message, config_.pump_poll_interval);
    if (status == process::InboxStatus::Timeout) {
      continue;
    }
    if (status == process::InboxStatus::Closed) {
      if (!stopping_) {
        std::string reason = endpoint_.exitReason();
        reportFatal(reason.empty() ? "child process exited" : reason);
      }
      break;
    }
    route(message);
  }
  RELAY_LOG(Debug, "pump stopped");
}

void Broker::route(const json::JsonValue& message) {
  if (hasId(message)) {
    json::JsonValue id = message.at("id");
    auto owner = correlation_.resolve(id);
    if (owner && registry_.contains(*owner)) {
      responses_routed_++;
      deliverFiltered(*owner, message);
      return;
    }
    if (!owner && id.isString() && id.getString() == process::kHealthProbeId) {
      RELAY_LOG(Debug, "discarding late health probe response");
      return;
    }
    if (!message.contains("method")) {
      // No live owner: every session sees it, like a notification
      orphans_++;
      if (owner) {
        RELAY_LOG(Debug, "owner {} of response {} is gone, broadcasting",
                  *owner, id.toString());
      } else {
        RELAY_LOG(Debug, "no owner for response {}, broadcasting",
                  id.toString());
      }
      for (const auto& session_id : registry_.ids()) {
        deliverFiltered(session_id, message);
      }
      return;
    }
  }

  notifications_++;
  for (const auto& session_id : registry_.ids()) {
    deliverFiltered(session_id, message);
  }
}

void Broker::deliverFiltered(const std::string& session_id,
                             const json::JsonValue& message) {
  auto filtered = pipeline_.process(filter::Direction::ServerToClient,
                                    session_id, message);
  if (filtered.blocked) {
    auto recorded = registry_.recordBlocked(session_id);
    if (isError(recorded)) {
      RELAY_LOG(Debug, "blocked count not recorded: {}",
                errorOf(recorded).message);
    }
    RELAY_LOG(Debug, "{} blocked delivery to session {}: {}",
              filtered.blocked_by, session_id, filtered.block_reason);
    return;
  }
  if (registry_.deliver(session_id, filtered.message) ==
      session::DeliveryStatus::Dropped) {
    queue_full_drops_++;
  }
}

void Broker::reportFatal(const std::string& reason) {
  bool expected = false;
  if (!fatal_reported_.compare_exchange_strong(expected, true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    down_reason_ = reason;
  }
  state_ = BridgeState::Down;
  RELAY_LOG(Critical, "bridge down: {}", reason);

  auto event = bridgeErrorEvent(reason);
  for (const auto& session_id : registry_.ids()) {
    registry_.deliver(session_id, event);
  }
}

size_t Broker::purgeCorrelations() {
  size_t purged = correlation_.purge(
      config_.correlation_ttl,
      [this](const std::string& session_id) {
        return registry_.contains(session_id);
      });
  if (purged > 0) {
    correlations_purged_ += purged;
    RELAY_LOG(Info, "purged {} stale correlation entries", purged);
  }
  return purged;
}

BrokerStats Broker::stats() const {
  BrokerStats stats;
  stats.submitted = submitted_.load();
  stats.forwarded = forwarded_.load();
  stats.blocked = blocked_.load();
  stats.ids_assigned = ids_assigned_.load();
  stats.responses_routed = responses_routed_.load();
  stats.notifications_fanned_out = notifications_.load();
  stats.orphans_broadcast = orphans_.load();
  stats.queue_full_drops = queue_full_drops_.load();
  stats.permit_waits = gate_.waits();
  stats.correlations_purged = correlations_purged_.load();
  stats.in_flight = gate_.inFlight();
  stats.pending_requests = correlation_.size();
  return stats;
}

}  // namespace broker
}  // namespace relay
