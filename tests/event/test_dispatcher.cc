#include <gtest/gtest.h>

#include <signal.h>

#include <atomic>
#include <thread>

#include "relay/event/dispatcher.h"

using namespace relay::event;
using namespace std::chrono_literals;

class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override { dispatcher_ = createLibeventDispatcher("test"); }

  DispatcherPtr dispatcher_;
};

TEST_F(DispatcherTest, PostBeforeRunExecutesOnLoopThread) {
  std::thread::id loop_thread;
  bool thread_safe = false;
  dispatcher_->post([&]() {
    loop_thread = std::this_thread::get_id();
    thread_safe = dispatcher_->isThreadSafe();
    dispatcher_->exit();
  });

  dispatcher_->run(RunType::RunUntilExit);
  EXPECT_EQ(loop_thread, std::this_thread::get_id());
  EXPECT_TRUE(thread_safe);
  EXPECT_FALSE(dispatcher_->isThreadSafe());
}

TEST_F(DispatcherTest, PostFromOtherThreadWakesLoop) {
  std::atomic<int> ran{0};
  std::thread loop([this]() { dispatcher_->run(RunType::RunUntilExit); });

  for (int i = 0; i < 10; ++i) {
    dispatcher_->post([&ran]() { ran++; });
  }
  dispatcher_->post([this]() { dispatcher_->exit(); });
  loop.join();

  EXPECT_EQ(ran.load(), 10);
}

TEST_F(DispatcherTest, TimerFiresAndRearms) {
  int fired = 0;
  TimerPtr timer;
  timer = dispatcher_->createTimer([&]() {
    if (++fired == 3) {
      dispatcher_->exit();
      return;
    }
    timer->enableTimer(5ms);
  });
  timer->enableTimer(5ms);
  EXPECT_TRUE(timer->enabled());

  dispatcher_->run(RunType::RunUntilExit);
  EXPECT_EQ(fired, 3);
}

TEST_F(DispatcherTest, DisabledTimerDoesNotFire) {
  bool fired = false;
  auto timer = dispatcher_->createTimer([&]() { fired = true; });
  timer->enableTimer(5ms);
  timer->disableTimer();
  EXPECT_FALSE(timer->enabled());

  auto stop = dispatcher_->createTimer([this]() { dispatcher_->exit(); });
  stop->enableTimer(30ms);
  dispatcher_->run(RunType::RunUntilExit);
  EXPECT_FALSE(fired);
}

TEST_F(DispatcherTest, SignalHandlerRunsOnLoop) {
  bool handled = false;
  auto signal_event = dispatcher_->listenForSignal(SIGUSR1, [&]() {
    handled = true;
    dispatcher_->exit();
  });
  dispatcher_->post([]() { ::raise(SIGUSR1); });

  dispatcher_->run(RunType::RunUntilExit);
  EXPECT_TRUE(handled);
}

TEST_F(DispatcherTest, NameIsKept) { EXPECT_EQ(dispatcher_->name(), "test"); }
