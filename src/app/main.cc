/**
 * @file main.cc
 * @brief mcp_relay: bridge a stdio JSON-RPC child to a console session
 *
 * The relay spawns the configured child, then serves one local session on
 * its own stdin/stdout with the same Content-Length framing. Every request
 * goes through the full broker path (filters, correlation, in-flight
 * permits), so this is also the simplest way to exercise a filter
 * configuration by hand:
 *
 *   mcp_relay --cmd "python3 my_server.py" --log-level debug
 *   mcp_relay --config relay.yaml -- /usr/bin/my-server --stdio
 *
 * Logs go to stderr (or the configured file); stdout carries frames only.
 * SIGINT/SIGTERM shut down gracefully.
 */

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <iostream>
#include <mutex>
#include <thread>

#include "relay/codec/byte_stream.h"
#include "relay/codec/framing.h"
#include "relay/config/config_loader.h"
#include "relay/core/error_codes.h"
#include "relay/event/dispatcher.h"
#include "relay/logging/log_sink.h"
#include "relay/logging/logger_registry.h"
#include "relay/server/bridge_server.h"

#define RELAY_LOG_COMPONENT "app"
#include "relay/logging/log_macros.h"

using namespace relay;

namespace {

constexpr std::chrono::seconds kStatusInterval{30};
constexpr std::chrono::milliseconds kWriterPoll{1000};
constexpr std::chrono::seconds kDrainTimeout{5};

void configureLogging(const config::LoggingConfig& cfg) {
  std::shared_ptr<logging::LogSink> sink;
  if (cfg.file.empty()) {
    sink = logging::SinkFactory::createStdioSink(true);
  } else {
    logging::RotatingFileSink::Config file_config;
    file_config.base_filename = cfg.file;
    file_config.max_file_size = cfg.max_file_size;
    file_config.max_files = cfg.max_files;
    sink = std::make_shared<logging::RotatingFileSink>(file_config);
  }
  if (cfg.format == "json") {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }

  auto& registry = logging::LoggerRegistry::instance();
  registry.setDefaultSink(sink);
  registry.setGlobalLevel(cfg.level);
}

// Blocking stdin source that can be woken from another thread
class InterruptibleSource : public codec::ByteSource {
 public:
  explicit InterruptibleSource(int fd) : fd_(fd) {
    if (::pipe(wake_) != 0) {
      wake_[0] = wake_[1] = -1;
    }
  }

  ~InterruptibleSource() override {
    for (int fd : wake_) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }

  Result<size_t> read(void* buffer, size_t length) override {
    pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_[0], POLLIN, 0}};
    nfds_t count = wake_[0] >= 0 ? 2 : 1;
    while (true) {
      int ready = ::poll(fds, count, -1);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        return makeError<size_t>(errors::kClosed, "poll failed on stdin");
      }
      if (count == 2 && (fds[1].revents & POLLIN)) {
        return makeError<size_t>(errors::kClosed, "console shutting down");
      }
      if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
        ssize_t n = ::read(fd_, buffer, length);
        if (n < 0 && errno == EINTR) {
          continue;
        }
        if (n < 0) {
          return makeError<size_t>(errors::kClosed, "read failed on stdin");
        }
        return static_cast<size_t>(n);
      }
    }
  }

  void interrupt() {
    if (wake_[1] >= 0) {
      char byte = 1;
      ssize_t ignored = ::write(wake_[1], &byte, 1);
      (void)ignored;
    }
  }

 private:
  int fd_;
  int wake_[2];
};

/**
 * One session bridged onto this process's stdio. The reader thread submits
 * frames from stdin; the writer thread pulls the session's queue and writes
 * frames to stdout. Either side ending asks the main loop to exit.
 */
class ConsoleSession {
 public:
  ConsoleSession(server::BridgeServer& server,
                 const std::string& session_id,
                 event::Dispatcher& main_loop)
      : server_(server),
        session_id_(session_id),
        main_loop_(main_loop),
        input_(STDIN_FILENO),
        output_(STDOUT_FILENO) {}

  ~ConsoleSession() { join(); }

  void start() {
    reader_ = std::thread([this]() { readLoop(); });
    writer_ = std::thread([this]() { writeLoop(); });
  }

  // The writer stops once the session is removed by BridgeServer::stop()
  void join() {
    input_.interrupt();
    if (reader_.joinable()) {
      reader_.join();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  bool bridgeFailed() const { return bridge_failed_.load(); }

 private:
  void readLoop() {
    const auto& limits = server_.config().process.limits;
    while (true) {
      json::JsonValue message;
      try {
        message = codec::readFrame(input_, limits);
      } catch (const codec::FramingError& e) {
        if (e.kind() == codec::FramingError::Kind::InvalidJson) {
          // Frame boundary is intact; report and keep reading
          writeError(json::JsonValue::null(), jsonrpc::PARSE_ERROR, e.what());
          continue;
        }
        if (e.kind() == codec::FramingError::Kind::EndOfStream) {
          RELAY_LOG(Info, "console input closed");
          drain();
        } else {
          RELAY_LOG(Warning, "console input ended: {}", e.what());
        }
        break;
      }

      auto submitted = server_.submit(session_id_, message);
      if (isError(submitted)) {
        const auto& error = errorOf(submitted);
        optional<json::JsonValue> id;
        if (message.isObject()) {
          id = message.find("id");
        }
        if (id) {
          writeError(*id, error.code, error.message);
        } else {
          RELAY_LOG(Warning, "submission rejected: {}", error.message);
        }
      }
    }
    requestExit();
  }

  // Gives outstanding responses a bounded chance to reach stdout
  void drain() {
    auto deadline = std::chrono::steady_clock::now() + kDrainTimeout;
    while (!exit_requested_.load() &&
           std::chrono::steady_clock::now() < deadline) {
      bool idle = server_.pendingRequests() == 0;
      for (const auto& info : server_.listSessions()) {
        if (info.id == session_id_ && info.queue_depth > 0) {
          idle = false;
        }
      }
      if (idle) {
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  void writeLoop() {
    while (true) {
      auto next = server_.nextFrame(session_id_, kWriterPoll);
      if (isError(next)) {
        break;
      }
      const auto& frame = get<session::OutboundFrame>(next);
      if (frame.heartbeat) {
        continue;
      }
      if (!write(frame.message)) {
        break;
      }
      auto type = frame.message.find("type");
      if (type && type->isString() && type->getString() == "bridge/error") {
        bridge_failed_ = true;
        break;
      }
    }
    requestExit();
  }

  bool write(const json::JsonValue& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    auto written = codec::writeFrame(output_, message);
    if (isError(written)) {
      RELAY_LOG(Error, "console output failed: {}", errorOf(written).message);
      return false;
    }
    return true;
  }

  void writeError(const json::JsonValue& id, int code,
                  const std::string& message) {
    write(json::JsonObjectBuilder()
              .add("jsonrpc", "2.0")
              .add("id", id)
              .add("error", json::JsonObjectBuilder()
                                .add("code", code)
                                .add("message", message)
                                .build())
              .build());
  }

  void requestExit() {
    bool expected = false;
    if (exit_requested_.compare_exchange_strong(expected, true)) {
      main_loop_.post([this]() { main_loop_.exit(); });
    }
  }

  server::BridgeServer& server_;
  const std::string session_id_;
  event::Dispatcher& main_loop_;

  InterruptibleSource input_;
  codec::FdByteSink output_;
  std::mutex output_mutex_;

  std::thread reader_;
  std::thread writer_;
  std::atomic<bool> exit_requested_{false};
  std::atomic<bool> bridge_failed_{false};
};

}  // namespace

int main(int argc, char* argv[]) {
  config::CommandLine cli;
  config::BridgeConfig bridge_config;
  try {
    cli = config::parseCommandLine(argc, argv);
    if (cli.help) {
      config::printUsage(argv[0]);
      return 0;
    }
    bridge_config = config::resolveConfig(cli);
  } catch (const config::ConfigError& e) {
    std::cerr << "mcp_relay: " << e.what() << "\n\n";
    config::printUsage(argv[0]);
    return 2;
  }

  configureLogging(bridge_config.logging);

  server::BridgeServer server(bridge_config);
  auto started = server.start();
  if (isError(started)) {
    RELAY_LOG(Critical, "bridge failed to start: {}",
              errorOf(started).message);
    return 1;
  }

  auto registered = server.registerSession();
  if (isError(registered)) {
    RELAY_LOG(Critical, "cannot open console session: {}",
              errorOf(registered).message);
    server.stop();
    return 1;
  }
  const std::string session_id = get<std::string>(registered);

  auto main_loop = event::createLibeventDispatcher("main");
  auto on_signal = [&main_loop]() {
    RELAY_LOG(Info, "shutdown signal received");
    main_loop->exit();
  };
  auto sigint = main_loop->listenForSignal(SIGINT, on_signal);
  auto sigterm = main_loop->listenForSignal(SIGTERM, on_signal);

  event::TimerPtr status_timer;
  status_timer = main_loop->createTimer([&]() {
    RELAY_LOG(Debug, "status {}", server.status().toString());
    status_timer->enableTimer(kStatusInterval);
  });
  status_timer->enableTimer(kStatusInterval);

  ConsoleSession console(server, session_id, *main_loop);
  console.start();
  RELAY_LOG(Info, "serving console session {}", session_id);

  main_loop->run(event::RunType::RunUntilExit);

  status_timer->disableTimer();
  server.stop();
  console.join();

  return console.bridgeFailed() ? 1 : 0;
}
