#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "relay/logging/log_level.h"
#include "relay/logging/log_message.h"
#include "relay/logging/log_sink.h"

namespace relay {
namespace logging {

class Logger : public std::enable_shared_from_this<Logger> {
 public:
  explicit Logger(const std::string& name, LogMode mode = LogMode::Sync)
      : effective_level_(LogLevel::Info), name_(name), mode_(mode) {}

  // Core logging methods with zero-cost when disabled
  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Debug)) {
      logImpl(LogLevel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Info)) {
      logImpl(LogLevel::Info, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void warning(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Warning)) {
      logImpl(LogLevel::Warning, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Error)) {
      logImpl(LogLevel::Error, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void critical(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Critical)) {
      logImpl(LogLevel::Critical,
              fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  // Context-aware logging
  template <typename... Args>
  void logWithContext(LogLevel level,
                      const LogContext& ctx,
                      fmt::format_string<Args...> fmt,
                      Args&&... args) {
    if (shouldLog(level)) {
      auto msg = ctx.toLogMessage(
          level, fmt::format(fmt, std::forward<Args>(args)...));
      msg.logger_name = name_;
      logMessage(msg);
    }
  }

  // Direct log with location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           fmt::format_string<Args...> fmt,
           Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg;
      msg.level = level;
      msg.message = fmt::format(fmt, std::forward<Args>(args)...);
      msg.logger_name = name_;
      msg.component = component_;
      msg.file = file;
      msg.line = line;
      msg.function = function;
      logMessage(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  void setMode(LogMode mode) { mode_ = mode; }

  void setComponent(Component component) { component_ = component; }

  bool shouldLog(LogLevel level) const {
    if (mode_ == LogMode::NoOp) {
      return false;
    }
    auto current = effective_level_.load(std::memory_order_relaxed);
    return current != LogLevel::Off && level >= current;
  }

  const std::string& getName() const { return name_; }

  void flush() {
    auto sink = getSink();
    if (sink) {
      sink->flush();
    }
  }

 protected:
  void logImpl(LogLevel level, const std::string& msg) {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.logger_name = name_;
    log_msg.component = component_;
    logMessage(log_msg);
  }

  void logMessage(const LogMessage& msg) {
    // Sinks serialize their own output; hold a reference so a concurrent
    // setSink() cannot destroy the sink mid-write
    auto sink = getSink();
    if (sink) {
      sink->log(msg);
    }
  }

 private:
  std::atomic<LogLevel> effective_level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  std::string name_;
  std::atomic<LogMode> mode_;
  Component component_{Component::Root};
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace relay
