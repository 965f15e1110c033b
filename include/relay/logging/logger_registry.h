#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "relay/logging/logger.h"

namespace relay {
namespace logging {

// Pattern for glob-style log level control ("filter.*" etc.)
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

/**
 * Process-wide logger directory. Logger names are dotted paths whose first
 * segment names the component ("broker", "filter.pipeline",
 * "process.stderr"); all loggers share the default sink unless given one.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setComponentLevel(Component component, LogLevel level);

  // Later patterns take precedence over earlier ones
  void setPattern(const std::string& pattern, LogLevel level);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  // Replaces the sink of every logger, existing and future
  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink() const;

  std::vector<std::string> getLoggerNames() const;

  // Restores defaults: Info level, stderr sink, no patterns
  void reset();

  static Component componentForName(const std::string& name);

 private:
  LoggerRegistry();

  void initializeDefaults();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<int, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace relay
