#include "relay/process/stdio_child_process.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

#include "relay/core/error_codes.h"

#define RELAY_LOG_COMPONENT "process"
#include "relay/logging/log_macros.h"

extern char** environ;

namespace relay {
namespace process {

namespace {

void ignoreSigpipeOnce() {
  // A dead child turns writes into EPIPE instead of killing the relay
  static std::once_flag once;
  std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> buildEnvironment(
    const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string kv(*entry);
    size_t eq = kv.find('=');
    if (eq != std::string::npos) {
      merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
  }
  for (const auto& kv : overrides) {
    merged[kv.first] = kv.second;
  }
  std::vector<std::string> result;
  result.reserve(merged.size());
  for (const auto& kv : merged) {
    result.push_back(kv.first + "=" + kv.second);
  }
  return result;
}

std::vector<char*> toCharArray(std::vector<std::string>& strings) {
  std::vector<char*> result;
  result.reserve(strings.size() + 1);
  for (auto& s : strings) {
    result.push_back(&s[0]);
  }
  result.push_back(nullptr);
  return result;
}

Error errnoError(const std::string& what, int err) {
  return Error(errors::kProcessError, what + ": " + strerror(err));
}

}  // namespace

StdioChildProcess::StdioChildProcess(const ProcessConfig& config)
    : config_(config), inbox_(config.inbox_capacity) {}

StdioChildProcess::~StdioChildProcess() { terminate(); }

VoidResult StdioChildProcess::start() {
  if (state_ != ProcessState::NotStarted) {
    return makeVoidError(
        Error(errors::kProcessError, "child process already started"));
  }
  if (config_.command.empty() && config_.argv.empty()) {
    return makeVoidError(
        Error(errors::kInvalidConfig, "no command configured for child"));
  }

  ignoreSigpipeOnce();

  // Everything exec needs is built before fork; the child only calls
  // async-signal-safe functions.
  std::vector<std::string> args;
  if (!config_.command.empty()) {
    args = {"/bin/sh", "-c", config_.command};
  } else {
    args = config_.argv;
  }
  std::vector<std::string> env = buildEnvironment(config_.environment);
  std::vector<char*> argv = toCharArray(args);
  std::vector<char*> envp = toCharArray(env);
  const char* cwd = config_.working_directory.empty()
                        ? nullptr
                        : config_.working_directory.c_str();

  int in_pipe[2], out_pipe[2], err_pipe[2], status_pipe[2];
  if (pipe2(in_pipe, O_CLOEXEC) != 0) {
    return makeVoidError(errnoError("pipe", errno));
  }
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    return makeVoidError(errnoError("pipe", err));
  }
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) {
      ::close(fd);
    }
    return makeVoidError(errnoError("pipe", err));
  }
  if (pipe2(status_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                   err_pipe[0], err_pipe[1]}) {
      ::close(fd);
    }
    return makeVoidError(errnoError("pipe", err));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                   err_pipe[0], err_pipe[1], status_pipe[0], status_pipe[1]}) {
      ::close(fd);
    }
    return makeVoidError(errnoError("fork", err));
  }

  if (pid == 0) {
    // Child: own process group so terminate() reaches grandchildren too
    setpgid(0, 0);
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    int err = 0;
    if (cwd && chdir(cwd) != 0) {
      err = errno;
    } else {
      execvpe(argv[0], argv.data(), envp.data());
      err = errno;
    }
    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  setpgid(pid, pid);
  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::close(status_pipe[1]);

  // The status pipe closes on successful exec; otherwise it carries errno
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    waitForExit(std::chrono::milliseconds(1000));
    closeFd(stdin_fd_);
    closeFd(stdout_fd_);
    closeFd(stderr_fd_);
    state_ = ProcessState::Exited;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      exit_reason_ = fmt::format("failed to launch child: {}",
                                 strerror(child_errno));
    }
    inbox_.close();
    return makeVoidError(errnoError("failed to launch child", child_errno));
  }

  state_ = ProcessState::Running;
  RELAY_LOG(Info, "started child pid={} cmd='{}'", pid_,
            config_.command.empty() ? args.front() : config_.command);

  reader_thread_ = std::thread([this]() { readLoop(); });
  stderr_thread_ = std::thread([this]() { stderrLoop(); });
  return makeVoidSuccess();
}

VoidResult StdioChildProcess::writeJSON(const json::JsonValue& message) {
  std::string frame = codec::encodeFrame(message);

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (state_ != ProcessState::Running || stdin_fd_ < 0) {
    return makeVoidError(
        Error(errors::kProcessError, "child process is not running"));
  }
  codec::FdByteSink sink(stdin_fd_);
  auto result = codec::writeAll(sink, frame.data(), frame.size());
  if (isError(result)) {
    return makeVoidError(Error(errors::kProcessError,
                               "write to child failed: " +
                                   errorOf(result).message));
  }
  frames_written_.fetch_add(1, std::memory_order_relaxed);
  bytes_written_.fetch_add(frame.size(), std::memory_order_relaxed);
  return makeVoidSuccess();
}

InboxStatus StdioChildProcess::nextMessage(json::JsonValue& out,
                                           std::chrono::milliseconds timeout) {
  switch (inbox_.popFor(out, timeout)) {
    case BlockingQueue<json::JsonValue>::PopStatus::Ok:
      return InboxStatus::Ok;
    case BlockingQueue<json::JsonValue>::PopStatus::Timeout:
      return InboxStatus::Timeout;
    case BlockingQueue<json::JsonValue>::PopStatus::Closed:
      break;
  }
  return InboxStatus::Closed;
}

std::string StdioChildProcess::exitReason() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return exit_reason_;
}

void StdioChildProcess::setExitCallback(ExitCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  exit_callback_ = std::move(callback);
}

ProcessStats StdioChildProcess::stats() const {
  ProcessStats stats;
  stats.frames_read = frames_read_.load();
  stats.frames_written = frames_written_.load();
  stats.bytes_written = bytes_written_.load();
  stats.stderr_lines = stderr_lines_.load();
  return stats;
}

HealthProbeResult StdioChildProcess::probeHealth(
    std::chrono::milliseconds timeout) {
  HealthProbeResult result;
  auto started = std::chrono::steady_clock::now();
  auto deadline = started + timeout;

  auto probe = json::JsonObjectBuilder()
                   .add("jsonrpc", "2.0")
                   .add("id", kHealthProbeId)
                   .add("method", "initialize")
                   .add("params",
                        json::JsonObjectBuilder()
                            .add("protocolVersion", "2024-11-05")
                            .add("capabilities", json::JsonValue::object())
                            .add("clientInfo",
                                 json::JsonObjectBuilder()
                                     .add("name", "Bridge Health Check")
                                     .add("version", "1.0.0")
                                     .build())
                            .build())
                   .build();

  auto write_result = writeJSON(probe);
  if (isError(write_result)) {
    result.detail = errorOf(write_result).message;
    RELAY_LOG(Warning, "health probe could not be sent: {}", result.detail);
    return result;
  }

  std::vector<json::JsonValue> held;
  bool answered = false;
  while (!answered) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.detail = fmt::format("no response within {}ms", timeout.count());
      break;
    }
    json::JsonValue message;
    auto status = nextMessage(
        message,
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    if (status == InboxStatus::Timeout) {
      continue;
    }
    if (status == InboxStatus::Closed) {
      result.detail = "child exited during health probe: " + exitReason();
      break;
    }

    auto id = message.find("id");
    if (!id || !id->isString() || id->getString() != kHealthProbeId) {
      held.push_back(std::move(message));
      continue;
    }
    answered = true;
    if (auto reply = message.find("result")) {
      result.healthy = true;
      result.detail = "ok";
      if (auto info = reply->find("serverInfo")) {
        result.server_info = *info;
      }
    } else if (auto error = message.find("error")) {
      result.detail = "initialize failed: " + error->toString();
    } else {
      result.detail = "initialize reply carried neither result nor error";
    }
  }

  for (auto it = held.rbegin(); it != held.rend(); ++it) {
    inbox_.pushFront(std::move(*it));
  }

  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (result.healthy) {
    RELAY_LOG(Info, "health probe passed in {}ms", result.elapsed.count());
  } else {
    RELAY_LOG(Warning, "health probe failed ({}); continuing startup",
              result.detail);
  }
  return result;
}

void StdioChildProcess::readLoop() {
  codec::FdByteSource source(stdout_fd_);
  std::string reason;

  while (true) {
    json::JsonValue message;
    try {
      message = codec::readFrame(source, config_.limits);
    } catch (const codec::FramingError& e) {
      if (e.kind() == codec::FramingError::Kind::EndOfStream) {
        reason = "child process exited (stdout closed)";
      } else {
        reason = fmt::format("framing error: {}", e.what());
      }
      break;
    }
    frames_read_.fetch_add(1, std::memory_order_relaxed);
    if (!inbox_.push(std::move(message))) {
      reason = "inbox closed";
      break;
    }
  }

  finishReading(reason);
}

void StdioChildProcess::finishReading(const std::string& reason) {
  ExitCallback callback;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exit_reason_.empty()) {
      exit_reason_ = reason;
    }
    callback = exit_callback_;
  }
  state_ = ProcessState::Exited;
  inbox_.close();

  if (terminating_) {
    RELAY_LOG(Debug, "read loop stopped: {}", reason);
    return;
  }
  RELAY_LOG(Error, "read loop ended: {}", reason);
  if (callback) {
    callback(reason);
  }
}

void StdioChildProcess::stderrLoop() {
  auto logger =
      logging::LoggerRegistry::instance().getOrCreateLogger("process.stderr");
  std::string pending;
  char buffer[4096];

  auto emit = [&](std::string line) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      return;
    }
    stderr_lines_.fetch_add(1, std::memory_order_relaxed);
    logger->info("[child stderr] {}", line);
  };

  codec::FdByteSource source(stderr_fd_);
  while (true) {
    auto result = source.read(buffer, sizeof(buffer));
    if (isError(result) || get<size_t>(result) == 0) {
      break;
    }
    pending.append(buffer, get<size_t>(result));
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      emit(pending.substr(0, newline));
      pending.erase(0, newline + 1);
    }
  }
  emit(pending);
}

bool StdioChildProcess::waitForExit(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    int status = 0;
    pid_t rc = waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
      exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status)
                                       : 128 + WTERMSIG(status);
      return true;
    }
    if (rc < 0 && errno != EINTR) {
      // ECHILD: already reaped
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void StdioChildProcess::terminate() {
  std::call_once(terminate_once_, [this]() {
    if (pid_ <= 0) {
      inbox_.close();
      return;
    }
    terminating_ = true;

    {
      std::lock_guard<std::mutex> lock(write_mutex_);
      closeFd(stdin_fd_);
    }

    if (!waitForExit(std::chrono::milliseconds(0))) {
      if (::kill(-pid_, SIGTERM) != 0) {
        ::kill(pid_, SIGTERM);
      }
      if (!waitForExit(config_.grace_period)) {
        RELAY_LOG(Warning, "child pid={} ignored SIGTERM for {}ms, killing",
                  pid_, config_.grace_period.count());
        if (::kill(-pid_, SIGKILL) != 0) {
          ::kill(pid_, SIGKILL);
        }
        waitForExit(std::chrono::hours(1));
      }
    }

    inbox_.close();
    if (reader_thread_.joinable()) {
      reader_thread_.join();
    }
    if (stderr_thread_.joinable()) {
      stderr_thread_.join();
    }
    closeFd(stdout_fd_);
    closeFd(stderr_fd_);

    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (exit_reason_.empty()) {
        exit_reason_ = "terminated";
      }
    }
    state_ = ProcessState::Exited;
    RELAY_LOG(Info, "child pid={} stopped with status {}", pid_,
              exit_status_.load());
  });
}

void StdioChildProcess::closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace process
}  // namespace relay
