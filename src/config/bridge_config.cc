#include "relay/config/bridge_config.h"

#include <cctype>

#include <fmt/format.h>

namespace relay {
namespace config {

namespace {

std::string dotted(const std::string& section, const std::string& key) {
  return section.empty() ? key : section + "." + key;
}

// Readers leave |out| untouched when the key is absent
void readString(const json::JsonValue& j, const std::string& section,
                const std::string& key, std::string& out) {
  if (auto field = j.find(key)) {
    if (!field->isString()) {
      throw ConfigError(dotted(section, key), "must be a string");
    }
    out = field->getString();
  }
}

void readBool(const json::JsonValue& j, const std::string& section,
              const std::string& key, bool& out) {
  if (auto field = j.find(key)) {
    if (!field->isBoolean()) {
      throw ConfigError(dotted(section, key), "must be a boolean");
    }
    out = field->getBool();
  }
}

void readUnsigned(const json::JsonValue& j, const std::string& section,
                  const std::string& key, uint64_t& out) {
  if (auto field = j.find(key)) {
    if (!field->isInteger() || field->getInt64() < 0) {
      throw ConfigError(dotted(section, key), "must be a non-negative integer");
    }
    out = static_cast<uint64_t>(field->getInt64());
  }
}

void readSize(const json::JsonValue& j, const std::string& section,
              const std::string& key, size_t& out) {
  uint64_t value = out;
  readUnsigned(j, section, key, value);
  out = static_cast<size_t>(value);
}

template <typename Duration>
void readDuration(const json::JsonValue& j, const std::string& section,
                  const std::string& key, std::chrono::milliseconds& out) {
  uint64_t value =
      static_cast<uint64_t>(std::chrono::duration_cast<Duration>(out).count());
  readUnsigned(j, section, key, value);
  out = std::chrono::duration_cast<std::chrono::milliseconds>(
      Duration(static_cast<typename Duration::rep>(value)));
}

json::JsonValue section(const json::JsonValue& j, const std::string& name) {
  auto found = j.find(name);
  if (!found) {
    return json::JsonValue::object();
  }
  if (!found->isObject()) {
    throw ConfigError(name, "must be an object");
  }
  return *found;
}

process::ProcessConfig parseProcess(const json::JsonValue& j) {
  process::ProcessConfig config;
  readString(j, "process", "command", config.command);
  readString(j, "process", "cwd", config.working_directory);

  if (auto args = j.find("args")) {
    if (!args->isArray()) {
      throw ConfigError("process.args", "must be an array of strings");
    }
    for (size_t i = 0; i < args->size(); ++i) {
      auto arg = args->at(i);
      if (!arg.isString()) {
        throw ConfigError("process.args", "must be an array of strings");
      }
      config.argv.push_back(arg.getString());
    }
  }

  if (auto env = j.find("env")) {
    if (!env->isObject()) {
      throw ConfigError("process.env", "must be an object of strings");
    }
    for (const auto& name : env->keys()) {
      auto value = env->at(name);
      if (!value.isString()) {
        throw ConfigError("process.env." + name, "must be a string");
      }
      config.environment[name] = value.getString();
    }
  }

  readDuration<std::chrono::milliseconds>(j, "process", "grace_period_ms",
                                          config.grace_period);
  readSize(j, "process", "inbox_capacity", config.inbox_capacity);
  readSize(j, "process", "max_message_size", config.limits.max_body_bytes);
  return config;
}

session::SessionConfig parseSession(const json::JsonValue& j) {
  session::SessionConfig config;
  readSize(j, "session", "max_queue_size", config.queue_capacity);
  readDuration<std::chrono::milliseconds>(j, "session",
                                          "heartbeat_interval_ms",
                                          config.heartbeat_interval);
  readDuration<std::chrono::seconds>(j, "session", "session_timeout",
                                     config.max_idle);
  readDuration<std::chrono::milliseconds>(j, "session", "sweep_interval_ms",
                                          config.sweep_interval);
  return config;
}

broker::BrokerConfig parseBroker(const json::JsonValue& j) {
  broker::BrokerConfig config;
  readSize(j, "broker", "max_in_flight", config.max_in_flight);
  readDuration<std::chrono::milliseconds>(j, "broker",
                                          "permit_poll_interval_ms",
                                          config.permit_poll_interval);
  readDuration<std::chrono::seconds>(j, "broker", "correlation_ttl",
                                     config.correlation_ttl);
  return config;
}

LoggingConfig parseLogging(const json::JsonValue& j) {
  LoggingConfig config;
  std::string level;
  readString(j, "logging", "level", level);
  if (!level.empty()) {
    std::string lowered = level;
    for (auto& c : lowered) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    config.level = logging::stringToLogLevel(lowered);
    if (config.level == logging::LogLevel::Info && lowered != "info") {
      throw ConfigError("logging.level", "unknown level '" + level + "'");
    }
  }
  readString(j, "logging", "format", config.format);
  if (config.format != "text" && config.format != "json") {
    throw ConfigError("logging.format", "must be 'text' or 'json'");
  }
  readString(j, "logging", "file", config.file);
  readSize(j, "logging", "max_file_size", config.max_file_size);
  readSize(j, "logging", "max_files", config.max_files);
  return config;
}

AuthConfig parseAuth(const json::JsonValue& j) {
  AuthConfig config;
  std::string mode;
  readString(j, "auth", "mode", mode);
  if (!mode.empty() && !parseAuthMode(mode, config.mode)) {
    throw ConfigError("auth.mode", "must be one of none, bearer, apikey");
  }
  readString(j, "auth", "secret", config.secret);
  return config;
}

HealthCheckConfig parseHealthCheck(const json::JsonValue& j) {
  HealthCheckConfig config;
  readBool(j, "health_check", "enabled", config.enabled);
  readDuration<std::chrono::milliseconds>(j, "health_check", "timeout_ms",
                                          config.timeout);
  return config;
}

}  // namespace

const char* authModeToString(AuthMode mode) {
  switch (mode) {
    case AuthMode::None:
      return "none";
    case AuthMode::Bearer:
      return "bearer";
    case AuthMode::ApiKey:
      return "apikey";
  }
  return "unknown";
}

bool parseAuthMode(const std::string& text, AuthMode& mode) {
  if (text == "none") {
    mode = AuthMode::None;
  } else if (text == "bearer") {
    mode = AuthMode::Bearer;
  } else if (text == "apikey" || text == "api_key") {
    mode = AuthMode::ApiKey;
  } else {
    return false;
  }
  return true;
}

BridgeConfig BridgeConfig::fromJson(const json::JsonValue& j) {
  if (!j.isObject()) {
    throw ConfigError("<root>", "configuration must be an object");
  }

  BridgeConfig config;
  config.process = parseProcess(section(j, "process"));
  config.session = parseSession(section(j, "session"));
  config.broker = parseBroker(section(j, "broker"));
  config.logging = parseLogging(section(j, "logging"));
  config.auth = parseAuth(section(j, "auth"));
  config.health_check = parseHealthCheck(section(j, "health_check"));

  if (j.contains("filters")) {
    auto filters = filter::FilterSettings::fromJson(section(j, "filters"));
    if (isError(filters)) {
      throw ConfigError("filters", errorOf(filters).message);
    }
    config.filters = get<filter::FilterSettings>(filters);
  }
  return config;
}

json::JsonValue BridgeConfig::toJson() const {
  json::JsonArrayBuilder args;
  for (const auto& arg : process.argv) {
    args.add(arg);
  }
  auto env = json::JsonValue::object();
  for (const auto& kv : process.environment) {
    env.set(kv.first, kv.second);
  }

  auto as_seconds = [](std::chrono::milliseconds ms) {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(ms).count());
  };

  return json::JsonObjectBuilder()
      .add("process",
           json::JsonObjectBuilder()
               .add("command", process.command)
               .add("args", args.build())
               .add("cwd", process.working_directory)
               .add("env", env)
               .add("grace_period_ms",
                    static_cast<int64_t>(process.grace_period.count()))
               .add("inbox_capacity",
                    static_cast<uint64_t>(process.inbox_capacity))
               .add("max_message_size",
                    static_cast<uint64_t>(process.limits.max_body_bytes))
               .build())
      .add("session",
           json::JsonObjectBuilder()
               .add("max_queue_size",
                    static_cast<uint64_t>(session.queue_capacity))
               .add("heartbeat_interval_ms",
                    static_cast<int64_t>(session.heartbeat_interval.count()))
               .add("session_timeout", as_seconds(session.max_idle))
               .add("sweep_interval_ms",
                    static_cast<int64_t>(session.sweep_interval.count()))
               .build())
      .add("broker",
           json::JsonObjectBuilder()
               .add("max_in_flight",
                    static_cast<uint64_t>(broker.max_in_flight))
               .add("permit_poll_interval_ms",
                    static_cast<int64_t>(broker.permit_poll_interval.count()))
               .add("correlation_ttl", as_seconds(broker.correlation_ttl))
               .build())
      .add("filters", filters.toJson())
      .add("logging",
           json::JsonObjectBuilder()
               .add("level", std::string(logging::logLevelToString(
                                 logging.level)))
               .add("format", logging.format)
               .add("file", logging.file)
               .add("max_file_size",
                    static_cast<uint64_t>(logging.max_file_size))
               .add("max_files", static_cast<uint64_t>(logging.max_files))
               .build())
      // The secret is never echoed back
      .add("auth", json::JsonObjectBuilder()
                       .add("mode", authModeToString(auth.mode))
                       .build())
      .add("health_check",
           json::JsonObjectBuilder()
               .add("enabled", health_check.enabled)
               .add("timeout_ms",
                    static_cast<int64_t>(health_check.timeout.count()))
               .build())
      .build();
}

void BridgeConfig::validate() const {
  if (process.command.empty() && process.argv.empty()) {
    throw ConfigError("process.command",
                      "a child command (command or args) is required");
  }
  if (process.inbox_capacity == 0) {
    throw ConfigError("process.inbox_capacity", "must be at least 1");
  }
  if (session.queue_capacity == 0) {
    throw ConfigError("session.max_queue_size", "must be at least 1");
  }
  if (session.heartbeat_interval.count() == 0) {
    throw ConfigError("session.heartbeat_interval_ms", "must be positive");
  }
  if (session.sweep_interval.count() == 0) {
    throw ConfigError("session.sweep_interval_ms", "must be positive");
  }
  if (broker.max_in_flight == 0) {
    throw ConfigError("broker.max_in_flight", "must be at least 1");
  }
  if (auth.mode != AuthMode::None && auth.secret.empty()) {
    throw ConfigError("auth.secret",
                      fmt::format("required when auth mode is {}",
                                  authModeToString(auth.mode)));
  }
  if (logging.max_files == 0) {
    throw ConfigError("logging.max_files", "must be at least 1");
  }
}

}  // namespace config
}  // namespace relay
