#pragma once

#include <string>
#include <vector>

#include "relay/config/bridge_config.h"
#include "relay/core/compat.h"

namespace YAML {
class Node;
}

namespace relay {
namespace config {

json::JsonValue yamlToJsonValue(const YAML::Node& node);

// Expands ${VAR} and ${VAR:-default}. An unset variable without a default
// is a ConfigError naming |field|.
std::string substituteEnvironment(const std::string& text,
                                  const std::string& field = "env");

// Reads a .json, .yaml or .yml document. Throws ConfigError.
json::JsonValue loadDocument(const std::string& path);

BridgeConfig loadConfigFile(const std::string& path);

// A standalone filter settings document, either bare or under "filters"
filter::FilterSettings loadFilterSettings(const std::string& path);

// BRIDGE_MAX_IN_FLIGHT, BRIDGE_AUTH_MODE, BRIDGE_AUTH_SECRET,
// BRIDGE_LOG_LEVEL
void applyEnvironmentOverrides(BridgeConfig& config);

struct CommandLine {
  optional<std::string> config_path;
  optional<std::string> command;
  optional<std::string> working_directory;
  optional<std::string> log_level;
  optional<std::string> filter_config_path;
  optional<size_t> max_queue_size;
  optional<uint64_t> session_timeout_seconds;
  optional<size_t> max_in_flight;
  bool no_health_check{false};
  bool help{false};
  // Anything after "--" is the child's argv
  std::vector<std::string> child_argv;
};

// Throws ConfigError on an unknown flag or a bad value
CommandLine parseCommandLine(int argc, const char* const argv[]);

void printUsage(const char* program);

// Defaults, then the config file, then the environment, then the flags
BridgeConfig resolveConfig(const CommandLine& cli);

}  // namespace config
}  // namespace relay
