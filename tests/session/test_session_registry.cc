#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "relay/core/error_codes.h"
#include "relay/session/session_registry.h"

using namespace relay;
using namespace relay::session;
using namespace std::chrono_literals;

namespace {

class RecordingSubscriber : public Subscriber {
 public:
  explicit RecordingSubscriber(bool connected = true) : connected_(connected) {}

  bool send(const json::JsonValue& frame) override {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.push_back(frame);
    return connected_;
  }

  size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
  }

 private:
  bool connected_;
  mutable std::mutex mutex_;
  std::vector<json::JsonValue> frames_;
};

json::JsonValue frame(int n) {
  return json::JsonObjectBuilder().add("jsonrpc", "2.0").add("id", n).build();
}

SessionConfig smallConfig() {
  SessionConfig config;
  config.queue_capacity = 2;
  config.heartbeat_interval = 20ms;
  return config;
}

}  // namespace

TEST(SessionRegistryTest, CreateAssignsUniqueOpaqueIds) {
  SessionRegistry registry;
  std::set<std::string> ids;
  for (int i = 0; i < 50; ++i) {
    ids.insert(registry.create());
  }
  EXPECT_EQ(ids.size(), 50u);
  EXPECT_EQ(registry.size(), 50u);
  EXPECT_EQ(ids.begin()->size(), 32u);
}

TEST(SessionRegistryTest, UnknownIdsReportNotFound) {
  SessionRegistry registry;
  EXPECT_FALSE(registry.contains("nope"));
  auto got = registry.get("nope");
  ASSERT_TRUE(isError(got));
  EXPECT_EQ(errorOf(got).code, errors::kSessionNotFound);
  EXPECT_TRUE(isError(registry.remove("nope")));
  EXPECT_TRUE(isError(registry.touch("nope")));
  EXPECT_TRUE(isError(registry.nextFrame("nope", 1ms)));
  EXPECT_EQ(registry.deliver("nope", frame(1)), DeliveryStatus::Closed);
}

TEST(SessionRegistryTest, DeliverThenPullInOrder) {
  SessionRegistry registry(smallConfig());
  auto id = registry.create();

  EXPECT_EQ(registry.deliver(id, frame(1)), DeliveryStatus::Queued);
  EXPECT_EQ(registry.deliver(id, frame(2)), DeliveryStatus::Queued);

  auto first = registry.nextFrame(id);
  ASSERT_FALSE(isError(first));
  EXPECT_FALSE(get<OutboundFrame>(first).heartbeat);
  EXPECT_EQ(get<OutboundFrame>(first).message.at("id").getInt(), 1);

  auto second = registry.nextFrame(id);
  EXPECT_EQ(get<OutboundFrame>(second).message.at("id").getInt(), 2);
}

TEST(SessionRegistryTest, FullQueueDropsNewest) {
  SessionRegistry registry(smallConfig());
  auto id = registry.create();

  registry.deliver(id, frame(1));
  registry.deliver(id, frame(2));
  EXPECT_EQ(registry.deliver(id, frame(3)), DeliveryStatus::Dropped);

  auto info = registry.info(id);
  ASSERT_FALSE(isError(info));
  EXPECT_EQ(get<SessionInfo>(info).queue_depth, 2u);
  EXPECT_EQ(get<SessionInfo>(info).dropped_messages, 1u);
  EXPECT_EQ(get<SessionInfo>(info).messages_delivered, 2u);

  EXPECT_EQ(get<OutboundFrame>(registry.nextFrame(id)).message.at("id").getInt(), 1);
  EXPECT_EQ(get<OutboundFrame>(registry.nextFrame(id)).message.at("id").getInt(), 2);
}

TEST(SessionRegistryTest, IdlePullYieldsHeartbeat) {
  SessionRegistry registry(smallConfig());
  auto id = registry.create();

  auto start = std::chrono::steady_clock::now();
  auto pulled = registry.nextFrame(id);
  ASSERT_FALSE(isError(pulled));
  EXPECT_TRUE(get<OutboundFrame>(pulled).heartbeat);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST(SessionRegistryTest, RemoveWakesBlockedPuller) {
  SessionRegistry registry(smallConfig());
  auto id = registry.create();

  std::atomic<bool> done{false};
  std::thread puller([&]() {
    auto pulled = registry.nextFrame(id, 10s);
    EXPECT_TRUE(isError(pulled));
    done = true;
  });

  std::this_thread::sleep_for(20ms);
  EXPECT_FALSE(isError(registry.remove(id)));
  puller.join();
  EXPECT_TRUE(done);
  EXPECT_FALSE(registry.contains(id));
  EXPECT_EQ(registry.deliver(id, frame(1)), DeliveryStatus::Closed);
}

TEST(SessionRegistryTest, SubscribersReceiveTeeAndArePrunedOnFailure) {
  SessionRegistry registry(smallConfig());
  auto id = registry.create();
  auto live = std::make_shared<RecordingSubscriber>();
  auto dead = std::make_shared<RecordingSubscriber>(false);

  ASSERT_FALSE(isError(registry.attachSubscriber(id, live)));
  ASSERT_FALSE(isError(registry.attachSubscriber(id, dead)));
  EXPECT_EQ(get<SessionInfo>(registry.info(id)).subscriber_count, 2u);

  registry.deliver(id, frame(1));
  EXPECT_EQ(live->count(), 1u);
  EXPECT_EQ(dead->count(), 1u);
  EXPECT_EQ(get<SessionInfo>(registry.info(id)).subscriber_count, 1u);

  registry.deliver(id, frame(2));
  EXPECT_EQ(live->count(), 2u);
  EXPECT_EQ(dead->count(), 1u);
  // Frames are still queued for pull delivery
  EXPECT_EQ(get<SessionInfo>(registry.info(id)).queue_depth, 2u);
}

TEST(SessionRegistryTest, DetachSubscriber) {
  SessionRegistry registry;
  auto id = registry.create();
  auto subscriber = std::make_shared<RecordingSubscriber>();

  auto attached = registry.attachSubscriber(id, subscriber);
  ASSERT_FALSE(isError(attached));
  SubscriberId subscriber_id = get<SubscriberId>(attached);

  EXPECT_FALSE(isError(registry.detachSubscriber(id, subscriber_id)));
  EXPECT_TRUE(isError(registry.detachSubscriber(id, subscriber_id)));

  registry.deliver(id, frame(1));
  EXPECT_EQ(subscriber->count(), 0u);
}

TEST(SessionRegistryTest, SweepRemovesOnlyIdleSessions) {
  SessionRegistry registry(smallConfig());
  auto stale = registry.create();
  auto fresh = registry.create();

  std::this_thread::sleep_for(60ms);
  ASSERT_FALSE(isError(registry.touch(fresh)));

  auto removed = registry.sweepIdle(40ms);
  ASSERT_EQ(removed.size(), 1u);
  EXPECT_EQ(removed.front(), stale);
  EXPECT_FALSE(registry.contains(stale));
  EXPECT_TRUE(registry.contains(fresh));
}

TEST(SessionRegistryTest, RecordBlockedIsCounted) {
  SessionRegistry registry;
  auto id = registry.create();
  ASSERT_FALSE(isError(registry.recordBlocked(id)));
  ASSERT_FALSE(isError(registry.recordBlocked(id)));
  EXPECT_EQ(get<SessionInfo>(registry.info(id)).blocked_messages, 2u);
}

TEST(SessionRegistryTest, RemoveAllClosesEverything) {
  SessionRegistry registry;
  auto a = registry.create();
  auto b = registry.create();
  registry.removeAll();
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_TRUE(registry.ids().empty());
  EXPECT_EQ(registry.deliver(a, frame(1)), DeliveryStatus::Closed);
  EXPECT_TRUE(isError(registry.get(b)));
}

TEST(SessionRegistryTest, ConcurrentDeliveryAcrossSessions) {
  SessionConfig config;
  config.queue_capacity = 1000;
  SessionRegistry registry(config);
  std::vector<std::string> ids;
  for (int i = 0; i < 4; ++i) {
    ids.push_back(registry.create());
  }

  std::vector<std::thread> producers;
  for (const auto& id : ids) {
    producers.emplace_back([&registry, id]() {
      for (int n = 0; n < 200; ++n) {
        registry.deliver(id, frame(n));
      }
    });
  }
  for (auto& t : producers) {
    t.join();
  }

  for (const auto& info : registry.list()) {
    EXPECT_EQ(info.queue_depth, 200u);
    EXPECT_EQ(info.dropped_messages, 0u);
  }
}
