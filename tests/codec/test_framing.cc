#include <gtest/gtest.h>

#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <thread>

#include "relay/codec/byte_stream.h"
#include "relay/codec/framing.h"

using namespace relay;
using namespace relay::codec;

namespace {

// Serves a fixed buffer, at most |chunk| bytes per read
class StringSource : public ByteSource {
 public:
  explicit StringSource(std::string data, size_t chunk = 4096)
      : data_(std::move(data)), chunk_(chunk) {}

  Result<size_t> read(void* buffer, size_t length) override {
    size_t n = std::min({length, chunk_, data_.size() - offset_});
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return n;
  }

  size_t consumed() const { return offset_; }

 private:
  std::string data_;
  size_t chunk_;
  size_t offset_{0};
};

// Accepts at most |chunk| bytes per write
class StringSink : public ByteSink {
 public:
  explicit StringSink(size_t chunk = 4096) : chunk_(chunk) {}

  Result<size_t> write(const void* data, size_t length) override {
    size_t n = std::min(length, chunk_);
    data_.append(static_cast<const char*>(data), n);
    return n;
  }

  const std::string& data() const { return data_; }

 private:
  size_t chunk_;
  std::string data_;
};

FramingError::Kind kindOf(const std::string& input,
                          const FramingLimits& limits = FramingLimits()) {
  StringSource source(input);
  try {
    readFrame(source, limits);
  } catch (const FramingError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected a FramingError for: " << input;
  return FramingError::Kind::IoError;
}

}  // namespace

TEST(FramingTest, EncodeUsesByteLengthOfCompactJson) {
  auto message = json::JsonValue::parse(R"({"id":1,"text":"é"})");
  std::string frame = encodeFrame(message);
  std::string body = message.toString();

  EXPECT_EQ(frame, "Content-Length: " + std::to_string(body.size()) +
                       "\r\n\r\n" + body);
  // 'é' is two bytes in UTF-8
  EXPECT_EQ(body.size(), std::string(R"({"id":1,"text":"é"})").size());
}

TEST(FramingTest, ReadsConsecutiveFrames) {
  auto first = json::JsonValue::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
  auto second = json::JsonValue::parse(R"({"jsonrpc":"2.0","method":"notifications/x"})");
  StringSource source(encodeFrame(first) + encodeFrame(second));

  EXPECT_EQ(readFrame(source), first);
  EXPECT_EQ(readFrame(source), second);
  try {
    readFrame(source);
    FAIL() << "expected end of stream";
  } catch (const FramingError& e) {
    EXPECT_EQ(e.kind(), FramingError::Kind::EndOfStream);
  }
}

TEST(FramingTest, ToleratesByteAtATimeDelivery) {
  auto message = json::JsonValue::parse(R"({"id":"abc","result":{"ok":true}})");
  StringSource source(encodeFrame(message), 1);
  EXPECT_EQ(readFrame(source), message);
}

TEST(FramingTest, DoesNotConsumePastTheFrame) {
  auto message = json::JsonValue::parse(R"({"id":2})");
  std::string frame = encodeFrame(message);
  StringSource source(frame + "Content-Length: 2\r\n\r\n{}");

  readFrame(source);
  EXPECT_EQ(source.consumed(), frame.size());
}

TEST(FramingTest, HeaderNamesAreCaseInsensitiveAndExtrasIgnored) {
  StringSource source(
      "content-type: application/vscode-jsonrpc; charset=utf-8\r\n"
      "CONTENT-LENGTH:   8  \r\n\r\n{\"a\":1}\n");
  // Body is exactly 8 bytes, trailing newline included
  auto value = readFrame(source);
  EXPECT_EQ(value.at("a").getInt(), 1);
}

TEST(FramingTest, MalformedInputKinds) {
  EXPECT_EQ(kindOf("Content-Length: 10\r\n"),
            FramingError::Kind::TruncatedHeader);
  EXPECT_EQ(kindOf("garbage\r\n\r\n"), FramingError::Kind::MalformedHeader);
  EXPECT_EQ(kindOf("Content-Type: x\r\n\r\n{}"),
            FramingError::Kind::MissingContentLength);
  EXPECT_EQ(kindOf("Content-Length: -5\r\n\r\n"),
            FramingError::Kind::InvalidContentLength);
  EXPECT_EQ(kindOf("Content-Length: \r\n\r\n"),
            FramingError::Kind::InvalidContentLength);
  EXPECT_EQ(kindOf("Content-Length: 10\r\n\r\n{}"),
            FramingError::Kind::TruncatedBody);
  EXPECT_EQ(kindOf("Content-Length: 3\r\n\r\n{x}"),
            FramingError::Kind::InvalidJson);
}

TEST(FramingTest, LimitsAreEnforced) {
  FramingLimits limits;
  limits.max_header_bytes = 32;
  limits.max_body_bytes = 16;

  EXPECT_EQ(kindOf("X-Padding: " + std::string(64, 'a') + "\r\n\r\n", limits),
            FramingError::Kind::HeaderTooLarge);
  EXPECT_EQ(kindOf("Content-Length: 17\r\n\r\n", limits),
            FramingError::Kind::FrameTooLarge);
  EXPECT_EQ(kindOf("Content-Length: 99999999999999999999999\r\n\r\n"),
            FramingError::Kind::FrameTooLarge);
}

TEST(FramingTest, WriteFrameHandlesShortWrites) {
  auto message = json::JsonValue::parse(R"({"id":3,"method":"echo","params":[1,2,3]})");
  StringSink sink(3);
  auto result = writeFrame(sink, message);
  ASSERT_FALSE(isError(result));
  EXPECT_EQ(sink.data(), encodeFrame(message));
}

TEST(FramingTest, FdStreamsOverPipe) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  auto message = json::JsonValue::parse(R"({"id":4,"result":"pong"})");

  std::thread writer([&]() {
    FdByteSink sink(fds[1]);
    EXPECT_FALSE(isError(writeFrame(sink, message)));
    ::close(fds[1]);
  });

  FdByteSource source(fds[0]);
  EXPECT_EQ(readFrame(source), message);
  writer.join();
  EXPECT_THROW(readFrame(source), FramingError);
  ::close(fds[0]);
}
