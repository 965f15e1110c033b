#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "relay/broker/correlation_table.h"
#include "relay/broker/inflight_gate.h"
#include "relay/core/result.h"
#include "relay/filter/filter_pipeline.h"
#include "relay/process/process_endpoint.h"
#include "relay/session/session_registry.h"

namespace relay {
namespace broker {

struct BrokerConfig {
  size_t max_in_flight{128};
  std::chrono::milliseconds permit_poll_interval{2};
  // Zero keeps correlation entries until their response arrives
  std::chrono::milliseconds correlation_ttl{600000};
  // Inbox wait slice; bounds how long stop() waits for the pump
  std::chrono::milliseconds pump_poll_interval{100};
};

enum class BridgeState { Idle, Running, Down, Stopped };

const char* bridgeStateToString(BridgeState state);

struct SubmitOutcome {
  json::JsonValue id;  // null for true notifications
  bool forwarded{false};
  bool blocked{false};
  std::string block_reason;
};

struct BrokerStats {
  uint64_t submitted{0};
  uint64_t forwarded{0};
  uint64_t blocked{0};
  uint64_t ids_assigned{0};
  uint64_t responses_routed{0};
  uint64_t notifications_fanned_out{0};
  uint64_t orphans_broadcast{0};
  uint64_t queue_full_drops{0};
  uint64_t permit_waits{0};
  uint64_t correlations_purged{0};
  size_t in_flight{0};
  size_t pending_requests{0};

  json::JsonValue toJson() const;
};

/**
 * @brief Demultiplexer between one child endpoint and many sessions
 *
 * Client-to-process: submit() records the request id against the session,
 * filters the message, answers a block with a synthesized -32000 error and
 * otherwise writes it to the child under an in-flight permit.
 *
 * Process-to-client: a pump thread drains the endpoint. A message whose id
 * is in the correlation table goes to its owner only while that session
 * lives. Everything else, including responses with no live owner, fans out
 * to every session registered at that moment; only a late health probe
 * reply is discarded.
 * Each delivery is filtered per target session. Queue-full drops the
 * newest frame; the pump never waits on a consumer.
 *
 * When the endpoint closes, the pump broadcasts a bridge/error event once
 * and the broker goes Down.
 */
class Broker {
 public:
  Broker(const BrokerConfig& config,
         process::ProcessEndpoint& endpoint,
         session::SessionRegistry& registry,
         filter::FilterPipeline& pipeline);
  ~Broker();

  Broker(const Broker&) = delete;
  Broker& operator=(const Broker&) = delete;

  void start();
  void stop();

  Result<SubmitOutcome> submit(const std::string& session_id,
                               const json::JsonValue& message);

  // Idempotent; only the first reason is broadcast
  void reportFatal(const std::string& reason);

  // Expires stale correlation entries and those of removed sessions
  size_t purgeCorrelations();

  BridgeState state() const { return state_.load(); }
  std::string downReason() const;
  BrokerStats stats() const;

  static json::JsonValue blockedResponse(const json::JsonValue& id,
                                         const std::string& filter_name,
                                         const std::string& reason);
  static json::JsonValue bridgeErrorEvent(const std::string& reason);

 private:
  void pumpLoop();
  void route(const json::JsonValue& message);
  void deliverFiltered(const std::string& session_id,
                       const json::JsonValue& message);
  json::JsonValue nextRequestId();

  const BrokerConfig config_;
  process::ProcessEndpoint& endpoint_;
  session::SessionRegistry& registry_;
  filter::FilterPipeline& pipeline_;

  CorrelationTable correlation_;
  InflightGate gate_;

  std::atomic<BridgeState> state_{BridgeState::Idle};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> fatal_reported_{false};
  mutable std::mutex reason_mutex_;
  std::string down_reason_;
  std::thread pump_thread_;

  std::atomic<uint64_t> next_id_{1};

  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> forwarded_{0};
  std::atomic<uint64_t> blocked_{0};
  std::atomic<uint64_t> ids_assigned_{0};
  std::atomic<uint64_t> responses_routed_{0};
  std::atomic<uint64_t> notifications_{0};
  std::atomic<uint64_t> orphans_{0};
  std::atomic<uint64_t> queue_full_drops_{0};
  std::atomic<uint64_t> correlations_purged_{0};
};

}  // namespace broker
}  // namespace relay
