#include "relay/logging/logger_registry.h"

#include <algorithm>
#include <cctype>

namespace relay {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() : global_level_(LogLevel::Info) {
  initializeDefaults();
}

void LoggerRegistry::initializeDefaults() {
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  default_logger_ = std::make_shared<Logger>("default", LogMode::Sync);
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);
  loggers_["default"] = default_logger_;
}

Component LoggerRegistry::componentForName(const std::string& name) {
  std::string head = name.substr(0, name.find('.'));
  for (int i = 0; i < static_cast<int>(Component::Count); ++i) {
    auto comp = static_cast<Component>(i);
    std::string comp_name = componentToString(comp);
    if (comp_name.size() == head.size() &&
        std::equal(head.begin(), head.end(), comp_name.begin(),
                   [](char a, char b) {
                     return std::tolower(static_cast<unsigned char>(a)) ==
                            std::tolower(static_cast<unsigned char>(b));
                   })) {
      return comp;
    }
  }
  return Component::Root;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name, LogMode::Sync);
  logger->setLevel(getEffectiveLevelLocked(name));
  logger->setComponent(componentForName(name));
  logger->setSink(default_sink_);

  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[static_cast<int>(component)] = level;
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  auto effective = getEffectiveLevelLocked(name);
  return effective != LogLevel::Off && level >= effective;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }

  auto comp = componentForName(name);
  if (comp != Component::Root) {
    auto it = component_levels_.find(static_cast<int>(comp));
    if (it != component_levels_.end()) {
      return it->second;
    }
  }

  return global_level_;
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  component_levels_.clear();
  global_level_ = LogLevel::Info;
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  // Loggers handed out earlier stay valid; re-point them at the defaults
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
    entry.second->setLevel(global_level_);
  }
}

}  // namespace logging
}  // namespace relay
