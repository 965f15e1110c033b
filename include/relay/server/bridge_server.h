#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "relay/broker/broker.h"
#include "relay/config/bridge_config.h"
#include "relay/core/result.h"
#include "relay/event/dispatcher.h"
#include "relay/filter/filter_pipeline.h"
#include "relay/process/stdio_child_process.h"
#include "relay/server/auth_gate.h"
#include "relay/session/session_registry.h"

namespace relay {
namespace server {

/**
 * @brief Owner of one bridge instance and its control surface
 *
 * Wires the child supervisor, session registry, filter pipeline and broker
 * together, and runs a dispatcher thread that sweeps idle sessions and
 * stale correlation entries every sweep interval. Everything an outer
 * transport needs goes through the methods below; all of them are
 * thread-safe.
 *
 * A failed readiness probe is logged and recorded in status() but does not
 * prevent startup; only a failure to spawn the child does.
 */
class BridgeServer {
 public:
  explicit BridgeServer(const config::BridgeConfig& config);
  ~BridgeServer();

  BridgeServer(const BridgeServer&) = delete;
  BridgeServer& operator=(const BridgeServer&) = delete;

  VoidResult start();
  void stop();

  Result<std::string> registerSession();
  Result<broker::SubmitOutcome> submit(const std::string& session_id,
                                       const json::JsonValue& message);
  Result<session::OutboundFrame> nextFrame(const std::string& session_id,
                                           std::chrono::milliseconds timeout);
  Result<session::SubscriberId> attachSubscriber(
      const std::string& session_id, session::SubscriberPtr subscriber);
  VoidResult detachSubscriber(const std::string& session_id,
                              session::SubscriberId subscriber_id);
  std::vector<session::SessionInfo> listSessions() const;
  VoidResult terminateSession(const std::string& session_id);

  std::vector<filter::FilterInfo> listFilters() const;
  VoidResult toggleFilter(const std::string& name, bool enabled);
  VoidResult replaceFilterConfig(const json::JsonValue& settings);
  void replaceFilterConfig(const filter::FilterSettings& settings);
  filter::FilterMetricsSnapshot filterMetrics() const;
  void resetFilterMetrics();

  json::JsonValue status() const;
  size_t pendingRequests() const { return broker_->stats().pending_requests; }

  VoidResult authorize(const Credentials& credentials) const;

  // One pass of the periodic maintenance the sweep timer runs
  void sweep();

  const config::BridgeConfig& config() const { return config_; }
  broker::BridgeState state() const { return broker_->state(); }

 private:
  void runDispatcher();
  void armSweepTimer();
  void onChildExit(const std::string& reason);
  void setHealth(const std::string& health, const std::string& detail);

  const config::BridgeConfig config_;

  std::unique_ptr<process::StdioChildProcess> child_;
  std::unique_ptr<session::SessionRegistry> registry_;
  std::unique_ptr<filter::FilterPipeline> pipeline_;
  std::unique_ptr<broker::Broker> broker_;
  AuthGate auth_;

  event::DispatcherPtr dispatcher_;
  event::TimerPtr sweep_timer_;
  std::thread dispatcher_thread_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
  std::chrono::steady_clock::time_point started_at_;

  mutable std::mutex health_mutex_;
  std::string health_{"unknown"};
  std::string health_detail_;
  json::JsonValue server_info_;
};

}  // namespace server
}  // namespace relay
