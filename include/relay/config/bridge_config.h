#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "relay/broker/broker.h"
#include "relay/filter/filter_config.h"
#include "relay/json/json_bridge.h"
#include "relay/logging/log_level.h"
#include "relay/process/stdio_child_process.h"
#include "relay/session/session.h"

namespace relay {
namespace config {

/**
 * @brief Configuration loading or validation failure
 *
 * field() names the offending key in dotted form ("session.max_queue_size").
 */
class ConfigError : public std::runtime_error {
 public:
  ConfigError(const std::string& field, const std::string& reason)
      : std::runtime_error("invalid configuration '" + field + "': " + reason),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string field_;
  std::string reason_;
};

struct LoggingConfig {
  logging::LogLevel level{logging::LogLevel::Info};
  // "text" or "json"
  std::string format{"text"};
  // Empty logs to stderr
  std::string file;
  size_t max_file_size{10 * 1024 * 1024};
  size_t max_files{5};
};

enum class AuthMode { None, Bearer, ApiKey };

const char* authModeToString(AuthMode mode);
bool parseAuthMode(const std::string& text, AuthMode& mode);

struct AuthConfig {
  AuthMode mode{AuthMode::None};
  std::string secret;
};

struct HealthCheckConfig {
  bool enabled{true};
  std::chrono::milliseconds timeout{10000};
};

struct BridgeConfig {
  process::ProcessConfig process;
  session::SessionConfig session;
  broker::BrokerConfig broker;
  filter::FilterSettings filters;
  LoggingConfig logging;
  AuthConfig auth;
  HealthCheckConfig health_check;

  // Missing sections keep their defaults. Throws ConfigError.
  static BridgeConfig fromJson(const json::JsonValue& j);
  json::JsonValue toJson() const;

  // Cross-field checks run after every override layer. Throws ConfigError.
  void validate() const;
};

}  // namespace config
}  // namespace relay
