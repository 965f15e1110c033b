#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "relay/codec/byte_stream.h"
#include "relay/codec/framing.h"
#include "relay/core/blocking_queue.h"
#include "relay/process/process_endpoint.h"

namespace relay {
namespace process {

// Sentinel id used by the readiness probe; responses carrying it are never
// routed to sessions.
constexpr const char* kHealthProbeId = "bridge-health-check";

struct ProcessConfig {
  // Shell command line, run through /bin/sh -c. Takes precedence over argv.
  std::string command;
  std::vector<std::string> argv;
  std::string working_directory;
  // Added to (or overriding) the relay's own environment
  std::map<std::string, std::string> environment;

  std::chrono::milliseconds grace_period{5000};
  size_t inbox_capacity{1024};
  codec::FramingLimits limits;
};

enum class ProcessState { NotStarted, Running, Exited };

struct ProcessStats {
  uint64_t frames_read{0};
  uint64_t frames_written{0};
  uint64_t bytes_written{0};
  uint64_t stderr_lines{0};
};

struct HealthProbeResult {
  bool healthy{false};
  std::string detail;
  std::chrono::milliseconds elapsed{0};
  json::JsonValue server_info;
};

/**
 * @brief Supervisor for the bridged child process
 *
 * Owns the child's stdio pipes and two threads: the reader decodes frames
 * from the child's stdout into a bounded inbox (a full inbox stalls the
 * reader, which stalls the child), and the diagnostic pump forwards stderr
 * lines into the relay's log. Writes are serialized by a single lock so
 * frames never interleave on the child's stdin.
 */
class StdioChildProcess : public ProcessEndpoint {
 public:
  using ExitCallback = std::function<void(const std::string& reason)>;

  explicit StdioChildProcess(const ProcessConfig& config);
  ~StdioChildProcess() override;

  StdioChildProcess(const StdioChildProcess&) = delete;
  StdioChildProcess& operator=(const StdioChildProcess&) = delete;

  VoidResult start();

  VoidResult writeJSON(const json::JsonValue& message) override;

  InboxStatus nextMessage(json::JsonValue& out,
                          std::chrono::milliseconds timeout) override;

  std::string exitReason() const override;

  /**
   * Sends a synthetic initialize request and waits for the matching reply.
   * Must run before anything else drains the inbox. Frames that arrive
   * ahead of the reply are put back in their original order.
   */
  HealthProbeResult probeHealth(
      std::chrono::milliseconds timeout = std::chrono::seconds(10));

  // SIGTERM, wait up to the grace period, then SIGKILL. Idempotent.
  void terminate();

  // Invoked once, from the reader thread, when the read loop ends on its
  // own (framing error or EOF). Not invoked for terminate().
  void setExitCallback(ExitCallback callback);

  ProcessState state() const { return state_.load(); }
  pid_t pid() const { return pid_; }
  int exitStatus() const { return exit_status_.load(); }
  ProcessStats stats() const;

 private:
  void readLoop();
  void stderrLoop();
  void finishReading(const std::string& reason);
  bool waitForExit(std::chrono::milliseconds timeout);
  void closeFd(int& fd);

  ProcessConfig config_;
  std::atomic<ProcessState> state_{ProcessState::NotStarted};
  pid_t pid_{-1};
  std::atomic<int> exit_status_{-1};

  int stdin_fd_{-1};
  int stdout_fd_{-1};
  int stderr_fd_{-1};

  std::mutex write_mutex_;
  BlockingQueue<json::JsonValue> inbox_;

  std::thread reader_thread_;
  std::thread stderr_thread_;
  std::atomic<bool> terminating_{false};
  std::once_flag terminate_once_;

  mutable std::mutex state_mutex_;
  std::string exit_reason_;
  ExitCallback exit_callback_;

  std::atomic<uint64_t> frames_read_{0};
  std::atomic<uint64_t> frames_written_{0};
  std::atomic<uint64_t> bytes_written_{0};
  std::atomic<uint64_t> stderr_lines_{0};
};

}  // namespace process
}  // namespace relay
