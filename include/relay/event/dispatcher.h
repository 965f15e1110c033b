#ifndef RELAY_EVENT_DISPATCHER_H
#define RELAY_EVENT_DISPATCHER_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace event {

class Dispatcher;
class Timer;
class SignalEvent;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;

using PostCb = std::function<void()>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

// Run types for dispatcher
enum class RunType {
  Block,        // Run until there are no more pending events
  NonBlock,     // Run one iteration
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * @brief One-shot timer owned by a dispatcher
 *
 * Re-arm from inside the callback for periodic work.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  /**
   * Disable the timer. No-op if already disabled.
   */
  virtual void disableTimer() = 0;

  /**
   * Enable the timer to fire once after the given duration.
   */
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;

  virtual bool enabled() = 0;
};

/**
 * @brief Signal registration; the handler runs on the dispatcher thread
 * for as long as this object lives.
 */
class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * @brief Event dispatcher interface
 *
 * Single-threaded loop with thread-safe posting. Timers and signals must be
 * created before run() or from the dispatcher thread.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  /**
   * Post a callback to be executed in the dispatcher thread.
   * Thread-safe: can be called from any thread.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * Check if the current thread is the dispatcher thread.
   */
  virtual bool isThreadSafe() const = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  virtual void run(RunType type) = 0;

  /**
   * Ask the loop to return. Thread-safe.
   */
  virtual void exit() = 0;
};

DispatcherPtr createLibeventDispatcher(const std::string& name);

}  // namespace event
}  // namespace relay

#endif  // RELAY_EVENT_DISPATCHER_H
