#include "relay/server/bridge_server.h"

#include <fmt/format.h>

#include "relay/core/error_codes.h"

#define RELAY_LOG_COMPONENT "server"
#include "relay/logging/log_macros.h"

namespace relay {
namespace server {

BridgeServer::BridgeServer(const config::BridgeConfig& config)
    : config_(config), auth_(config.auth) {
  child_ = std::make_unique<process::StdioChildProcess>(config_.process);
  registry_ = std::make_unique<session::SessionRegistry>(config_.session);
  pipeline_ = filter::FilterPipeline::createDefault(config_.filters);
  broker_ = std::make_unique<broker::Broker>(config_.broker, *child_,
                                             *registry_, *pipeline_);
  dispatcher_ = event::createLibeventDispatcher("bridge");

  child_->setExitCallback(
      [this](const std::string& reason) { onChildExit(reason); });
}

BridgeServer::~BridgeServer() { stop(); }

VoidResult BridgeServer::start() {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true)) {
    return makeVoidError(Error(errors::kInvalidConfig, "already started"));
  }
  started_at_ = std::chrono::steady_clock::now();

  auto spawned = child_->start();
  if (isError(spawned)) {
    setHealth("failed", errorOf(spawned).message);
    RELAY_LOG(Error, "cannot start child process: {}",
              errorOf(spawned).message);
    return spawned;
  }

  if (config_.health_check.enabled) {
    auto probe = child_->probeHealth(config_.health_check.timeout);
    {
      std::lock_guard<std::mutex> lock(health_mutex_);
      server_info_ = probe.server_info;
    }
    if (probe.healthy) {
      setHealth("healthy", probe.detail);
    } else {
      setHealth("unhealthy", probe.detail);
      RELAY_LOG(Warning, "readiness probe failed ({}); continuing anyway",
                probe.detail);
    }
  } else {
    setHealth("unchecked", "health check disabled");
  }

  broker_->start();

  sweep_timer_ = dispatcher_->createTimer([this]() {
    sweep();
    armSweepTimer();
  });
  armSweepTimer();
  dispatcher_thread_ = std::thread([this]() { runDispatcher(); });

  RELAY_LOG(Info, "bridge started (child pid {}, max in-flight {})",
            child_->pid(), config_.broker.max_in_flight);
  return makeVoidSuccess();
}

void BridgeServer::stop() {
  if (!started_.load()) {
    return;
  }
  bool expected = false;
  if (!stopped_.compare_exchange_strong(expected, true)) {
    return;
  }

  if (dispatcher_thread_.joinable()) {
    dispatcher_->post([this]() {
      if (sweep_timer_) {
        sweep_timer_->disableTimer();
      }
      dispatcher_->exit();
    });
    dispatcher_thread_.join();
  }
  sweep_timer_.reset();

  broker_->stop();
  registry_->removeAll();
  child_->terminate();
  RELAY_LOG(Info, "bridge stopped");
}

void BridgeServer::runDispatcher() {
  RELAY_LOG(Debug, "dispatcher thread running");
  dispatcher_->run(event::RunType::RunUntilExit);
  RELAY_LOG(Debug, "dispatcher thread exiting");
}

void BridgeServer::armSweepTimer() {
  if (sweep_timer_ && !stopped_.load()) {
    sweep_timer_->enableTimer(config_.session.sweep_interval);
  }
}

void BridgeServer::sweep() {
  auto removed = registry_->sweepIdle(config_.session.max_idle);
  if (!removed.empty()) {
    RELAY_LOG(Info, "swept {} idle session(s)", removed.size());
  }
  broker_->purgeCorrelations();
}

void BridgeServer::onChildExit(const std::string& reason) {
  setHealth("exited", reason);
  RELAY_LOG(Error, "child process exited: {}", reason);
}

void BridgeServer::setHealth(const std::string& health,
                             const std::string& detail) {
  std::lock_guard<std::mutex> lock(health_mutex_);
  health_ = health;
  health_detail_ = detail;
}

Result<std::string> BridgeServer::registerSession() {
  if (broker_->state() == broker::BridgeState::Down) {
    return makeError<std::string>(errors::kBridgeDown,
                                  "bridge is down: " + broker_->downReason());
  }
  return registry_->create();
}

Result<broker::SubmitOutcome> BridgeServer::submit(
    const std::string& session_id,
    const json::JsonValue& message) {
  return broker_->submit(session_id, message);
}

Result<session::OutboundFrame> BridgeServer::nextFrame(
    const std::string& session_id,
    std::chrono::milliseconds timeout) {
  return registry_->nextFrame(session_id, timeout);
}

Result<session::SubscriberId> BridgeServer::attachSubscriber(
    const std::string& session_id,
    session::SubscriberPtr subscriber) {
  return registry_->attachSubscriber(session_id, std::move(subscriber));
}

VoidResult BridgeServer::detachSubscriber(const std::string& session_id,
                                          session::SubscriberId subscriber_id) {
  return registry_->detachSubscriber(session_id, subscriber_id);
}

std::vector<session::SessionInfo> BridgeServer::listSessions() const {
  return registry_->list();
}

VoidResult BridgeServer::terminateSession(const std::string& session_id) {
  return registry_->remove(session_id);
}

std::vector<filter::FilterInfo> BridgeServer::listFilters() const {
  return pipeline_->listFilters();
}

VoidResult BridgeServer::toggleFilter(const std::string& name, bool enabled) {
  return pipeline_->setFilterEnabled(name, enabled);
}

VoidResult BridgeServer::replaceFilterConfig(const json::JsonValue& settings) {
  auto parsed = filter::FilterSettings::fromJson(settings);
  if (isError(parsed)) {
    return makeVoidError(errorOf(parsed));
  }
  replaceFilterConfig(get<filter::FilterSettings>(parsed));
  return makeVoidSuccess();
}

void BridgeServer::replaceFilterConfig(const filter::FilterSettings& settings) {
  pipeline_->replaceConfig(settings);
}

filter::FilterMetricsSnapshot BridgeServer::filterMetrics() const {
  return pipeline_->metrics();
}

void BridgeServer::resetFilterMetrics() { pipeline_->resetMetrics(); }

VoidResult BridgeServer::authorize(const Credentials& credentials) const {
  return auth_.authorize(credentials);
}

json::JsonValue BridgeServer::status() const {
  auto broker_stats = broker_->stats();
  auto process_stats = child_->stats();

  json::JsonObjectBuilder health;
  {
    std::lock_guard<std::mutex> lock(health_mutex_);
    health.add("status", health_).add("detail", health_detail_);
    if (!server_info_.isNull()) {
      health.add("server_info", server_info_);
    }
  }

  int64_t uptime_ms = 0;
  if (started_.load()) {
    uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started_at_)
                    .count();
  }

  json::JsonObjectBuilder builder;
  builder.add("state", broker::bridgeStateToString(broker_->state()))
      .add("child_pid", static_cast<int64_t>(child_->pid()))
      .add("uptime_ms", uptime_ms)
      .add("health", health.build())
      .add("sessions", static_cast<uint64_t>(registry_->size()))
      .add("in_flight", static_cast<uint64_t>(broker_stats.in_flight))
      .add("max_in_flight", static_cast<uint64_t>(config_.broker.max_in_flight))
      .add("filter_config_version", pipeline_->configVersion())
      .add("auth_mode", config::authModeToString(auth_.mode()))
      .add("broker", broker_stats.toJson())
      .add("process", json::JsonObjectBuilder()
                          .add("frames_read", process_stats.frames_read)
                          .add("frames_written", process_stats.frames_written)
                          .add("bytes_written", process_stats.bytes_written)
                          .add("stderr_lines", process_stats.stderr_lines)
                          .build());

  std::string reason = broker_->downReason();
  if (!reason.empty()) {
    builder.add("down_reason", reason);
  }
  return builder.build();
}

}  // namespace server
}  // namespace relay
