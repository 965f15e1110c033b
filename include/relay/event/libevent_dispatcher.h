#ifndef RELAY_EVENT_LIBEVENT_DISPATCHER_H
#define RELAY_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>

#include "relay/event/dispatcher.h"

// Forward declarations for libevent types
struct event_base;
struct event;

namespace relay {
namespace event {

// Rename to avoid conflict with struct event
using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() override { return name_; }

  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  TimerPtr createTimer(TimerCb cb) override;
  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;

  void run(RunType type) override;
  void exit() override;

  event_base* base() { return base_; }

 private:
  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_;
    bool enabled_;
  };

  class SignalEventImpl : public SignalEvent {
   public:
    SignalEventImpl(LibeventDispatcher& dispatcher,
                    int signal_num,
                    SignalCb cb);
    ~SignalEventImpl() override;

   private:
    static void signalCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    int signal_num_;
    SignalCb cb_;
    libevent_event* event_;
  };

  void initializeLibevent();
  void runPostCallbacks();
  void wakeup();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};  // Pipe for waking up event loop
  libevent_event* wakeup_event_{nullptr};
};

}  // namespace event
}  // namespace relay

#endif  // RELAY_EVENT_LIBEVENT_DISPATCHER_H
