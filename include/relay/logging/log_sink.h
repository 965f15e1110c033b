#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>

#include "relay/logging/log_formatter.h"
#include "relay/logging/log_message.h"

namespace relay {
namespace logging {

// Base sink interface
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  virtual bool supportsRotation() const { return false; }
  virtual SinkType type() const = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Stdio sink. The relay's stdout may carry protocol frames, so the
// default target is stderr.
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;

  SinkType type() const override { return SinkType::Stdio; }

 private:
  Target target_;
  std::mutex mutex_;
};

// File sink with size and age based rotation
class RotatingFileSink : public LogSink {
 public:
  struct Config {
    std::string base_filename;
    size_t max_file_size = 50 * 1024 * 1024;  // 50MB
    size_t max_files = 5;
    std::chrono::hours rotation_interval{24};
  };

  explicit RotatingFileSink(const Config& config);
  ~RotatingFileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;

  SinkType type() const override { return SinkType::File; }
  bool supportsRotation() const override { return true; }

  bool isOpen() const;

 private:
  void openFile();
  void closeFile();
  void checkRotation();
  void rotate();

  Config config_;
  std::unique_ptr<std::ofstream> current_file_;
  std::chrono::system_clock::time_point last_rotation_;
  size_t current_size_{0};
  mutable std::mutex mutex_;
};

// High-performance null sink
class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

// Callback sink; hands the raw record and its formatted text to the owner
class ExternalSink : public LogSink {
 public:
  using LogCallback = std::function<void(const LogMessage&, const std::string&)>;

  explicit ExternalSink(LogCallback callback) : callback_(std::move(callback)) {}

  void log(const LogMessage& msg) override {
    if (callback_) {
      callback_(msg, formatter_->format(msg));
    }
  }

  void flush() override {}
  SinkType type() const override { return SinkType::External; }

 private:
  LogCallback callback_;
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createFileSink(const std::string& filename) {
    RotatingFileSink::Config config;
    config.base_filename = filename;
    return std::make_unique<RotatingFileSink>(config);
  }

  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true) {
    return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                  : StdioSink::Stdout);
  }

  static std::unique_ptr<LogSink> createNullSink() {
    return std::make_unique<NullSink>();
  }

  static std::unique_ptr<LogSink> createExternalSink(
      ExternalSink::LogCallback callback) {
    return std::make_unique<ExternalSink>(std::move(callback));
  }
};

}  // namespace logging
}  // namespace relay
