#include "relay/event/libevent_dispatcher.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#define RELAY_LOG_COMPONENT "event.dispatcher"
#include "relay/logging/log_macros.h"

namespace relay {
namespace event {

namespace {

// Uses std::call_once so the first dispatcher enables libevent locking
// before any event_base exists.
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();
  // thread_id_ is only set once run() is called
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
  if (config) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  RELAY_LOG(Debug, "dispatcher '{}' using backend {}", name_,
            event_base_get_method(base_));

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }
  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);
  fcntl(wakeup_fd_[0], F_SETFD, FD_CLOEXEC);
  fcntl(wakeup_fd_[1], F_SETFD, FD_CLOEXEC);

  wakeup_event_ = event_new(
      base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
      reinterpret_cast<event_callback_fn>(&LibeventDispatcher::postWakeupCallback),
      this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }
  event_add(wakeup_event_, nullptr);
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  if (need_wakeup && !isThreadSafe()) {
    wakeup();
  }
}

void LibeventDispatcher::wakeup() {
  char byte = 1;
  ssize_t rc;
  do {
    rc = write(wakeup_fd_[1], &byte, 1);
  } while (rc < 0 && errno == EINTR);
  // EAGAIN means the pipe already holds a pending wakeup
}

bool LibeventDispatcher::isThreadSafe() const {
  // Before run() nobody owns the loop yet
  auto owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return std::make_unique<SignalEventImpl>(*this, signal_num, std::move(cb));
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    wakeup();
  }
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  switch (type) {
    case RunType::Block:
      event_base_loop(base_, 0);
      break;
    case RunType::NonBlock:
      event_base_loop(base_, EVLOOP_NONBLOCK);
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      break;
  }

  runPostCallbacks();
  thread_id_ = std::thread::id();
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
    // Drain the pipe
  }

  dispatcher->runPostCallbacks();
  if (dispatcher->exit_requested_) {
    event_base_loopbreak(dispatcher->base_);
  }
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    callbacks.front()();
    callbacks.pop();
  }
}

// TimerImpl implementation
LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)), enabled_(false) {
  event_ = evtimer_new(
      dispatcher_.base(),
      reinterpret_cast<event_callback_fn>(&TimerImpl::timerCallback), this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_ && event_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  struct timeval tv;
  tv.tv_sec = duration.count() / 1000;
  tv.tv_usec = (duration.count() % 1000) * 1000;

  event_add(event_, &tv);
  enabled_ = true;
}

bool LibeventDispatcher::TimerImpl::enabled() { return enabled_; }

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);
  timer->enabled_ = false;
  timer->cb_();
}

// SignalEventImpl implementation
LibeventDispatcher::SignalEventImpl::SignalEventImpl(
    LibeventDispatcher& dispatcher, int signal_num, SignalCb cb)
    : dispatcher_(dispatcher), signal_num_(signal_num), cb_(std::move(cb)) {
  event_ = evsignal_new(
      dispatcher_.base(), signal_num_,
      reinterpret_cast<event_callback_fn>(&SignalEventImpl::signalCallback),
      this);
  if (!event_) {
    throw std::runtime_error("Failed to create signal event");
  }
  event_add(event_, nullptr);
}

LibeventDispatcher::SignalEventImpl::~SignalEventImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::SignalEventImpl::signalCallback(int fd,
                                                         short /*events*/,
                                                         void* arg) {
  auto* signal_event = static_cast<SignalEventImpl*>(arg);
  RELAY_LOG(Debug, "signal {} delivered to '{}'", fd,
            signal_event->dispatcher_.name());
  signal_event->cb_();
}

DispatcherPtr createLibeventDispatcher(const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

}  // namespace event
}  // namespace relay
