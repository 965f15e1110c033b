#include "relay/config/config_loader.h"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

#define RELAY_LOG_COMPONENT "config"
#include "relay/logging/log_macros.h"

namespace relay {
namespace config {

namespace {

constexpr size_t kMaxConfigFileBytes = 20 * 1024 * 1024;

std::string readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ConfigError(path, "cannot open file");
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  std::string text = contents.str();
  if (text.size() > kMaxConfigFileBytes) {
    throw ConfigError(path, "file exceeds 20 MiB");
  }
  return text;
}

bool endsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Plain scalars only; quoted YAML strings keep their type
json::JsonValue scalarToJsonValue(const YAML::Node& node) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    return json::JsonValue(text);
  }
  if (text == "true" || text == "false") {
    return json::JsonValue(text == "true");
  }
  if (text == "null" || text == "~") {
    return json::JsonValue::null();
  }

  static const std::regex kInteger(R"(^[-+]?[0-9]+$)");
  static const std::regex kFloat(
      R"(^[-+]?([0-9]+\.[0-9]*|\.[0-9]+)([eE][-+]?[0-9]+)?$)");
  try {
    if (std::regex_match(text, kInteger)) {
      return json::JsonValue(static_cast<int64_t>(std::stoll(text)));
    }
    if (std::regex_match(text, kFloat)) {
      return json::JsonValue(std::stod(text));
    }
  } catch (const std::out_of_range&) {
    // Too large for a number; keep the text
  }
  return json::JsonValue(text);
}

size_t parseCount(const std::string& flag, const std::string& text) {
  static const std::regex kDigits(R"(^[0-9]+$)");
  if (!std::regex_match(text, kDigits)) {
    throw ConfigError(flag, "expected a non-negative integer, got '" + text +
                                "'");
  }
  try {
    return static_cast<size_t>(std::stoull(text));
  } catch (const std::out_of_range&) {
    throw ConfigError(flag, "value out of range: " + text);
  }
}

logging::LogLevel parseLevel(const std::string& field,
                             const std::string& text) {
  std::string lowered = text;
  for (auto& c : lowered) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  auto level = logging::stringToLogLevel(lowered);
  if (level == logging::LogLevel::Info && lowered != "info") {
    throw ConfigError(field, "unknown log level '" + text + "'");
  }
  return level;
}

}  // namespace

json::JsonValue yamlToJsonValue(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return json::JsonValue::null();
    case YAML::NodeType::Scalar:
      return scalarToJsonValue(node);
    case YAML::NodeType::Sequence: {
      auto result = json::JsonValue::array();
      for (const auto& item : node) {
        result.push_back(yamlToJsonValue(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = json::JsonValue::object();
      for (const auto& pair : node) {
        result.set(pair.first.as<std::string>(), yamlToJsonValue(pair.second));
      }
      return result;
    }
  }
  return json::JsonValue::null();
}

std::string substituteEnvironment(const std::string& text,
                                  const std::string& field) {
  static const std::regex kEnvRef(
      R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");

  std::string result;
  size_t expanded = 0;
  auto begin = text.cbegin();
  std::smatch match;
  while (std::regex_search(begin, text.cend(), match, kEnvRef)) {
    result.append(begin, match[0].first);

    std::string name = match[1].str();
    const char* value = std::getenv(name.c_str());
    if (value) {
      result.append(value);
    } else if (match[2].matched) {
      result.append(match[3].str());
    } else {
      throw ConfigError(field,
                        "undefined environment variable ${" + name + "}");
    }
    ++expanded;
    begin = match[0].second;
  }
  result.append(begin, text.cend());

  if (expanded > 0) {
    RELAY_LOG(Debug, "expanded {} environment references in {}", expanded,
              field);
  }
  return result;
}

json::JsonValue loadDocument(const std::string& path) {
  std::string content = substituteEnvironment(readFile(path), path);

  if (endsWith(path, ".json")) {
    try {
      return json::JsonValue::parse(content);
    } catch (const json::JsonException& e) {
      throw ConfigError(path, std::string("JSON parse error: ") + e.what());
    }
  }

  // YAML is a superset of JSON, so anything else goes through yaml-cpp
  try {
    YAML::Node root = YAML::Load(content);
    auto document = yamlToJsonValue(root);
    if (document.isNull()) {
      return json::JsonValue::object();
    }
    return document;
  } catch (const YAML::ParserException& e) {
    throw ConfigError(path, std::string("YAML parse error: ") + e.what());
  } catch (const YAML::BadConversion& e) {
    throw ConfigError(path, std::string("YAML conversion error: ") + e.what());
  }
}

BridgeConfig loadConfigFile(const std::string& path) {
  auto document = loadDocument(path);
  auto config = BridgeConfig::fromJson(document);
  RELAY_LOG(Info, "loaded configuration from {}", path);
  return config;
}

filter::FilterSettings loadFilterSettings(const std::string& path) {
  auto document = loadDocument(path);
  // A full bridge config nests settings under "filters"; a bare settings
  // document uses the same key for the name -> bool enablement map.
  if (auto nested = document.find("filters")) {
    bool enablement_map = nested->isObject();
    if (enablement_map) {
      for (const auto& key : nested->keys()) {
        if (!nested->at(key).isBoolean()) {
          enablement_map = false;
          break;
        }
      }
    }
    if (nested->isObject() && !enablement_map) {
      document = *nested;
    }
  }
  auto settings = filter::FilterSettings::fromJson(document);
  if (isError(settings)) {
    throw ConfigError(path, errorOf(settings).message);
  }
  RELAY_LOG(Info, "loaded filter settings from {}", path);
  return get<filter::FilterSettings>(settings);
}

void applyEnvironmentOverrides(BridgeConfig& config) {
  if (const char* value = std::getenv("BRIDGE_MAX_IN_FLIGHT")) {
    config.broker.max_in_flight = parseCount("BRIDGE_MAX_IN_FLIGHT", value);
  }
  if (const char* value = std::getenv("BRIDGE_AUTH_MODE")) {
    if (!parseAuthMode(value, config.auth.mode)) {
      throw ConfigError("BRIDGE_AUTH_MODE",
                        "must be one of none, bearer, apikey");
    }
  }
  if (const char* value = std::getenv("BRIDGE_AUTH_SECRET")) {
    config.auth.secret = value;
  }
  if (const char* value = std::getenv("BRIDGE_LOG_LEVEL")) {
    config.logging.level = parseLevel("BRIDGE_LOG_LEVEL", value);
  }
}

CommandLine parseCommandLine(int argc, const char* const argv[]) {
  CommandLine cli;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw ConfigError(arg, "missing value");
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      cli.help = true;
    } else if (arg == "--config") {
      cli.config_path = value();
    } else if (arg == "--cmd") {
      cli.command = value();
    } else if (arg == "--cwd") {
      cli.working_directory = value();
    } else if (arg == "--log-level") {
      cli.log_level = value();
    } else if (arg == "--filter-config") {
      cli.filter_config_path = value();
    } else if (arg == "--max-queue-size") {
      cli.max_queue_size = parseCount(arg, value());
    } else if (arg == "--session-timeout") {
      cli.session_timeout_seconds = parseCount(arg, value());
    } else if (arg == "--max-in-flight") {
      cli.max_in_flight = parseCount(arg, value());
    } else if (arg == "--no-health-check") {
      cli.no_health_check = true;
    } else if (arg == "--") {
      for (++i; i < argc; ++i) {
        cli.child_argv.push_back(argv[i]);
      }
    } else {
      throw ConfigError(arg, "unknown option");
    }
  }
  return cli;
}

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " [options] [-- child argv...]\n\n";
  std::cerr << "Bridges one stdio JSON-RPC child process to many sessions.\n\n";
  std::cerr << "Options:\n";
  std::cerr << "  --config <file>          YAML or JSON configuration file\n";
  std::cerr << "  --cmd <command>          Child command line (run via /bin/sh -c)\n";
  std::cerr << "  --cwd <dir>              Child working directory\n";
  std::cerr << "  --log-level <level>      debug, info, notice, warning, error, ...\n";
  std::cerr << "  --filter-config <file>   Filter settings document\n";
  std::cerr << "  --max-queue-size <n>     Per-session queue capacity (default: 100)\n";
  std::cerr << "  --session-timeout <s>    Idle seconds before a session is swept (default: 300)\n";
  std::cerr << "  --max-in-flight <n>      Concurrent writes to the child (default: 128)\n";
  std::cerr << "  --no-health-check        Skip the startup readiness probe\n";
  std::cerr << "  --help                   Show this help message\n\n";
  std::cerr << "Environment: BRIDGE_MAX_IN_FLIGHT, BRIDGE_AUTH_MODE, "
               "BRIDGE_AUTH_SECRET, BRIDGE_LOG_LEVEL\n";
}

BridgeConfig resolveConfig(const CommandLine& cli) {
  BridgeConfig config;
  if (cli.config_path) {
    config = loadConfigFile(*cli.config_path);
  }

  applyEnvironmentOverrides(config);

  if (cli.command) {
    config.process.command = *cli.command;
  }
  if (!cli.child_argv.empty()) {
    config.process.command.clear();
    config.process.argv = cli.child_argv;
  }
  if (cli.working_directory) {
    config.process.working_directory = *cli.working_directory;
  }
  if (cli.log_level) {
    config.logging.level = parseLevel("--log-level", *cli.log_level);
  }
  if (cli.filter_config_path) {
    config.filters = loadFilterSettings(*cli.filter_config_path);
  }
  if (cli.max_queue_size) {
    config.session.queue_capacity = *cli.max_queue_size;
  }
  if (cli.session_timeout_seconds) {
    config.session.max_idle = std::chrono::seconds(*cli.session_timeout_seconds);
  }
  if (cli.max_in_flight) {
    config.broker.max_in_flight = *cli.max_in_flight;
  }
  if (cli.no_health_check) {
    config.health_check.enabled = false;
  }

  config.validate();
  return config;
}

}  // namespace config
}  // namespace relay
