#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "relay/json/json_bridge.h"
#include "relay/logging/log_formatter.h"
#include "relay/logging/log_sink.h"

using namespace relay;
using namespace relay::logging;

namespace {

LogMessage makeMessage(const std::string& text, LogLevel level = LogLevel::Info) {
  LogMessage msg;
  msg.level = level;
  msg.message = text;
  msg.logger_name = "session.registry";
  msg.component = Component::Session;
  return msg;
}

std::string readAll(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool exists(const std::string& path) { return ::access(path.c_str(), F_OK) == 0; }

}  // namespace

TEST(LogFormatterTest, DefaultFormatterIncludesCorrelationFields) {
  DefaultFormatter formatter;
  auto msg = makeMessage("queue full");
  msg.session_id = "abc";
  msg.request_id = "7";
  msg.direction = "server_to_client";
  msg.filter_name = "pii_redactor";

  std::string line = formatter.format(msg);
  EXPECT_NE(line.find("[INFO]"), std::string::npos);
  EXPECT_NE(line.find("[Session]"), std::string::npos);
  EXPECT_NE(line.find("[session:abc]"), std::string::npos);
  EXPECT_NE(line.find("[req:7]"), std::string::npos);
  EXPECT_NE(line.find("[server_to_client]"), std::string::npos);
  EXPECT_NE(line.find("[filter:pii_redactor]"), std::string::npos);
  EXPECT_NE(line.find("queue full"), std::string::npos);
}

TEST(LogFormatterTest, JsonFormatterProducesParseableJson) {
  JsonFormatter formatter;
  auto msg = makeMessage("line one\nline \"two\"", LogLevel::Warning);
  msg.session_id = "abc";
  msg.key_values["dropped"] = "1";

  auto parsed = json::JsonValue::parse(formatter.format(msg));
  EXPECT_EQ(parsed.at("level").getString(), "WARNING");
  EXPECT_EQ(parsed.at("logger").getString(), "session.registry");
  EXPECT_EQ(parsed.at("session_id").getString(), "abc");
  EXPECT_EQ(parsed.at("message").getString(), "line one\nline \"two\"");
  EXPECT_EQ(parsed.at("metadata").at("dropped").getString(), "1");
}

TEST(LogSinkTest, ExternalSinkReceivesFormattedLine) {
  std::string last;
  ExternalSink sink([&last](const LogMessage&, const std::string& formatted) {
    last = formatted;
  });
  sink.log(makeMessage("hello"));
  EXPECT_NE(last.find("hello"), std::string::npos);
}

TEST(LogSinkTest, FactoryTypes) {
  EXPECT_EQ(SinkFactory::createNullSink()->type(), SinkType::Null);
  EXPECT_EQ(SinkFactory::createStdioSink()->type(), SinkType::Stdio);
}

class RotatingFileSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char dir_template[] = "/tmp/relay_log_sink_XXXXXX";
    ASSERT_NE(::mkdtemp(dir_template), nullptr);
    dir_ = dir_template;
    base_ = dir_ + "/relay.log";
  }

  void TearDown() override {
    for (int i = 0; i <= 4; ++i) {
      std::string path = i == 0 ? base_ : base_ + "." + std::to_string(i);
      std::remove(path.c_str());
    }
    ::rmdir(dir_.c_str());
  }

  std::string dir_;
  std::string base_;
};

TEST_F(RotatingFileSinkTest, WritesLines) {
  RotatingFileSink::Config config;
  config.base_filename = base_;
  {
    RotatingFileSink sink(config);
    ASSERT_TRUE(sink.isOpen());
    sink.log(makeMessage("first"));
    sink.log(makeMessage("second"));
  }

  std::string content = readAll(base_);
  EXPECT_NE(content.find("first"), std::string::npos);
  EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(RotatingFileSinkTest, RotatesWhenFull) {
  RotatingFileSink::Config config;
  config.base_filename = base_;
  config.max_file_size = 64;
  config.max_files = 2;
  {
    RotatingFileSink sink(config);
    for (int i = 0; i < 20; ++i) {
      sink.log(makeMessage("message number " + std::to_string(i)));
    }
  }

  EXPECT_TRUE(exists(base_));
  EXPECT_TRUE(exists(base_ + ".1"));
  EXPECT_TRUE(exists(base_ + ".2"));
  EXPECT_FALSE(exists(base_ + ".3"));
  EXPECT_NE(readAll(base_).find("message number 19"), std::string::npos);
}
