#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <vector>

#include "relay/core/error_codes.h"
#include "relay/server/bridge_server.h"

using namespace relay;
using namespace relay::server;
using namespace std::chrono_literals;

namespace {

class RecordingSubscriber : public session::Subscriber {
 public:
  bool send(const json::JsonValue& frame) override {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.push_back(frame);
    return true;
  }

  size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<json::JsonValue> frames_;
};

class BridgeServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.process.argv = {MOCK_STDIO_SERVER_PATH};
    config_.process.grace_period = 1000ms;
    config_.health_check.timeout = 5000ms;
    config_.broker.pump_poll_interval = 10ms;
  }

  void TearDown() override {
    if (server_) {
      server_->stop();
    }
  }

  void startServer() {
    server_ = std::make_unique<BridgeServer>(config_);
    auto started = server_->start();
    ASSERT_FALSE(isError(started)) << errorOf(started).message;
  }

  std::string openSession() {
    auto registered = server_->registerSession();
    EXPECT_FALSE(isError(registered));
    return isError(registered) ? std::string() : get<std::string>(registered);
  }

  static json::JsonValue request(const json::JsonValue& id,
                                 const std::string& method,
                                 const json::JsonValue& params =
                                     json::JsonValue::object()) {
    return json::JsonObjectBuilder()
        .add("jsonrpc", "2.0")
        .add("id", id)
        .add("method", method)
        .add("params", params)
        .build();
  }

  // Pulls frames for |session_id| until one satisfies |match|
  template <typename Match>
  json::JsonValue waitFor(const std::string& session_id, Match match,
                          std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      auto next = server_->nextFrame(session_id, 50ms);
      if (isError(next)) {
        ADD_FAILURE() << errorOf(next).message;
        break;
      }
      const auto& frame = get<session::OutboundFrame>(next);
      if (!frame.heartbeat && match(frame.message)) {
        return frame.message;
      }
    }
    ADD_FAILURE() << "no matching frame for session " << session_id;
    return json::JsonValue::null();
  }

  json::JsonValue responseTo(const std::string& session_id,
                             const json::JsonValue& id) {
    return waitFor(session_id, [&id](const json::JsonValue& message) {
      auto got = message.find("id");
      return got && *got == id && !message.contains("method");
    });
  }

  json::JsonValue methodFrame(const std::string& session_id,
                              const std::string& method) {
    return waitFor(session_id, [&method](const json::JsonValue& message) {
      auto got = message.find("method");
      return got && got->isString() && got->getString() == method;
    });
  }

  config::BridgeConfig config_;
  std::unique_ptr<BridgeServer> server_;
};

}  // namespace

TEST_F(BridgeServerTest, ConcurrentSessionsGetTheirOwnResponses) {
  startServer();
  auto a = openSession();
  auto b = openSession();

  ASSERT_FALSE(isError(server_->submit(
      a, request(json::JsonValue(1), "echo",
                 json::JsonObjectBuilder().add("who", "a").build()))));
  ASSERT_FALSE(isError(server_->submit(
      b, request(json::JsonValue("1"), "echo",
                 json::JsonObjectBuilder().add("who", "b").build()))));

  EXPECT_EQ(responseTo(a, json::JsonValue(1)).at("result").at("who").getString(), "a");
  EXPECT_EQ(responseTo(b, json::JsonValue("1")).at("result").at("who").getString(), "b");
  EXPECT_EQ(server_->pendingRequests(), 0u);
}

TEST_F(BridgeServerTest, PingReachesOnlyTheRequester) {
  startServer();
  auto a = openSession();
  auto b = openSession();

  ASSERT_FALSE(isError(server_->submit(
      a, json::JsonValue::parse(R"({"jsonrpc":"2.0","id":"1","method":"ping"})"))));
  auto response = responseTo(a, json::JsonValue("1"));
  EXPECT_EQ(response.at("result").getString(), "pong");

  auto idle = server_->nextFrame(b, 100ms);
  ASSERT_FALSE(isError(idle));
  EXPECT_TRUE(get<session::OutboundFrame>(idle).heartbeat);
}

TEST_F(BridgeServerTest, PolicyBlocksOnlyMatchingPayloads) {
  config_.filters.blocked_domains = {"malware.test.com"};
  startServer();
  auto a = openSession();

  auto blocked_params = json::JsonObjectBuilder()
                            .add("name", "fetch")
                            .add("arguments", json::JsonObjectBuilder()
                                                  .add("url", "https://malware.test.com/payload")
                                                  .build())
                            .build();
  auto outcome = server_->submit(a, request(json::JsonValue(1), "echo", blocked_params));
  ASSERT_FALSE(isError(outcome));
  EXPECT_TRUE(get<broker::SubmitOutcome>(outcome).blocked);

  auto rejection = responseTo(a, json::JsonValue(1));
  EXPECT_EQ(rejection.at("error").at("code").getInt(), jsonrpc::BLOCKED_BY_POLICY);

  auto legit_params = json::JsonObjectBuilder()
                          .add("name", "fetch")
                          .add("arguments", json::JsonObjectBuilder()
                                                .add("url", "https://legit.example.com/page")
                                                .build())
                          .build();
  ASSERT_FALSE(isError(server_->submit(a, request(json::JsonValue(2), "echo", legit_params))));
  EXPECT_EQ(responseTo(a, json::JsonValue(2)).at("result"), legit_params);

  auto status = server_->status();
  EXPECT_EQ(status.at("broker").at("blocked").getInt(), 1);
  // Probe initialize plus the forwarded echo
  EXPECT_EQ(status.at("process").at("frames_written").getInt(), 2);
}

TEST_F(BridgeServerTest, NotificationsAndServerRequestsReachEverySession) {
  startServer();
  auto a = openSession();
  auto b = openSession();

  ASSERT_FALSE(isError(server_->submit(
      a, request(json::JsonValue(1), "emit",
                 json::JsonObjectBuilder().add("level", "info").build()))));
  for (const auto& id : {a, b}) {
    EXPECT_EQ(methodFrame(id, "notifications/message").at("params").at("level").getString(),
              "info");
  }
  EXPECT_EQ(responseTo(a, json::JsonValue(1)).at("result").getString(), "emitted");

  ASSERT_FALSE(isError(server_->submit(b, request(json::JsonValue(2), "ask"))));
  for (const auto& id : {a, b}) {
    EXPECT_EQ(methodFrame(id, "sampling/createMessage").at("id").getString(),
              "server-req-1");
  }
}

TEST_F(BridgeServerTest, ChildCrashTakesBridgeDown) {
  startServer();
  auto a = openSession();
  auto b = openSession();

  ASSERT_FALSE(isError(server_->submit(a, request(json::JsonValue(1), "crash"))));

  for (const auto& id : {a, b}) {
    auto event = waitFor(id, [](const json::JsonValue& message) {
      auto type = message.find("type");
      return type && type->isString() && type->getString() == "bridge/error";
    });
    EXPECT_FALSE(event.at("error").getString().empty());
  }
  EXPECT_EQ(server_->state(), broker::BridgeState::Down);

  auto refused = server_->submit(a, request(json::JsonValue(2), "ping"));
  ASSERT_TRUE(isError(refused));
  EXPECT_EQ(errorOf(refused).code, errors::kBridgeDown);

  auto registered = server_->registerSession();
  ASSERT_TRUE(isError(registered));
  EXPECT_EQ(errorOf(registered).code, errors::kBridgeDown);

  auto status = server_->status();
  EXPECT_EQ(status.at("state").getString(), "down");
  EXPECT_TRUE(status.contains("down_reason"));
  EXPECT_EQ(status.at("health").at("status").getString(), "exited");
}

TEST_F(BridgeServerTest, StatusReportsHealthyProbe) {
  config_.auth.mode = config::AuthMode::Bearer;
  config_.auth.secret = "s3cret";
  startServer();
  openSession();

  auto status = server_->status();
  EXPECT_EQ(status.at("state").getString(), "running");
  EXPECT_EQ(status.at("sessions").getInt(), 1);
  EXPECT_GT(status.at("child_pid").getInt(), 0);
  EXPECT_EQ(status.at("auth_mode").getString(), "bearer");
  EXPECT_EQ(status.at("max_in_flight").getInt(), 128);
  EXPECT_EQ(status.at("health").at("status").getString(), "healthy");
  EXPECT_EQ(status.at("health").at("server_info").at("name").getString(),
            "mock-stdio-server");

  EXPECT_FALSE(isError(server_->authorize({{"Authorization", "Bearer s3cret"}})));
  EXPECT_TRUE(isError(server_->authorize({})));
}

TEST_F(BridgeServerTest, UnansweredProbeStillStarts) {
  config_.process.environment["MOCK_IGNORE_INIT"] = "1";
  config_.health_check.timeout = 200ms;
  startServer();
  auto a = openSession();

  EXPECT_EQ(server_->status().at("health").at("status").getString(), "unhealthy");
  ASSERT_FALSE(isError(server_->submit(a, request(json::JsonValue(1), "ping"))));
  EXPECT_EQ(responseTo(a, json::JsonValue(1)).at("result").getString(), "pong");
}

TEST_F(BridgeServerTest, DisabledProbeIsUnchecked) {
  config_.health_check.enabled = false;
  startServer();
  EXPECT_EQ(server_->status().at("health").at("status").getString(), "unchecked");
}

TEST_F(BridgeServerTest, SpawnFailureFailsStart) {
  config_.process.argv = {"/nonexistent/relay-child"};
  server_ = std::make_unique<BridgeServer>(config_);

  auto started = server_->start();
  ASSERT_TRUE(isError(started));
  EXPECT_EQ(errorOf(started).code, errors::kProcessError);
  EXPECT_EQ(server_->status().at("health").at("status").getString(), "failed");
}

TEST_F(BridgeServerTest, IdleSessionsAreSweptByTimer) {
  config_.session.max_idle = 50ms;
  config_.session.sweep_interval = 20ms;
  startServer();
  auto idle = openSession();

  for (int i = 0; i < 100 && !server_->listSessions().empty(); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_TRUE(server_->listSessions().empty());
  EXPECT_TRUE(isError(server_->nextFrame(idle, 1ms)));
}

TEST_F(BridgeServerTest, TerminateSessionAndSubscribers) {
  startServer();
  auto a = openSession();
  auto subscriber = std::make_shared<RecordingSubscriber>();
  auto attached = server_->attachSubscriber(a, subscriber);
  ASSERT_FALSE(isError(attached));

  ASSERT_FALSE(isError(server_->submit(a, request(json::JsonValue(1), "ping"))));
  responseTo(a, json::JsonValue(1));
  EXPECT_EQ(subscriber->count(), 1u);

  EXPECT_FALSE(isError(server_->detachSubscriber(a, get<session::SubscriberId>(attached))));
  EXPECT_FALSE(isError(server_->terminateSession(a)));
  EXPECT_TRUE(isError(server_->terminateSession(a)));

  auto gone = server_->submit(a, request(json::JsonValue(2), "ping"));
  ASSERT_TRUE(isError(gone));
  EXPECT_EQ(errorOf(gone).code, errors::kSessionNotFound);
}

TEST_F(BridgeServerTest, FilterControlSurface) {
  startServer();
  auto a = openSession();
  uint64_t version = server_->status().at("filter_config_version").getInt64();

  EXPECT_EQ(server_->listFilters().size(), 7u);
  auto missing = server_->toggleFilter("nope", true);
  ASSERT_TRUE(isError(missing));
  EXPECT_EQ(errorOf(missing).code, errors::kFilterNotFound);

  auto invalid = server_->replaceFilterConfig(
      json::JsonValue::parse(R"({"redact_emails":"sometimes"})"));
  ASSERT_TRUE(isError(invalid));
  EXPECT_EQ(errorOf(invalid).code, errors::kInvalidConfig);
  EXPECT_EQ(server_->status().at("filter_config_version").getInt64(), version);

  ASSERT_FALSE(isError(server_->replaceFilterConfig(
      json::JsonValue::parse(R"({"blocked_keywords":["forbidden"]})"))));
  EXPECT_GT(server_->status().at("filter_config_version").getInt64(), version);

  auto outcome = server_->submit(
      a, request(json::JsonValue(1), "echo",
                 json::JsonObjectBuilder().add("q", "forbidden fruit").build()));
  ASSERT_FALSE(isError(outcome));
  EXPECT_TRUE(get<broker::SubmitOutcome>(outcome).blocked);

  ASSERT_FALSE(isError(server_->toggleFilter("blacklist", false)));
  outcome = server_->submit(
      a, request(json::JsonValue(2), "echo",
                 json::JsonObjectBuilder().add("q", "forbidden fruit").build()));
  ASSERT_FALSE(isError(outcome));
  EXPECT_TRUE(get<broker::SubmitOutcome>(outcome).forwarded);

  EXPECT_GE(server_->filterMetrics().blocked, 1u);
  server_->resetFilterMetrics();
  EXPECT_EQ(server_->filterMetrics().blocked, 0u);
}
