#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "relay/codec/byte_stream.h"
#include "relay/core/result.h"
#include "relay/json/json_bridge.h"

namespace relay {
namespace codec {

/**
 * @file framing.h
 * @brief Content-Length framing for JSON-RPC over a raw byte stream
 *
 * Wire format, bit for bit:
 *
 *   Content-Length: <decimal>\r\n
 *   [other headers, ignored]\r\n
 *   \r\n
 *   <exactly n bytes of UTF-8 JSON>
 *
 * Header names are matched case-insensitively. The header block is read one
 * byte at a time so no byte of the following body is ever consumed early.
 */

class FramingError : public std::runtime_error {
 public:
  enum class Kind {
    EndOfStream,       // clean EOF before the first header byte
    TruncatedHeader,   // EOF inside the header block
    MalformedHeader,   // header line without ':'
    MissingContentLength,
    InvalidContentLength,
    HeaderTooLarge,
    FrameTooLarge,
    TruncatedBody,     // EOF before n body bytes arrived
    InvalidJson,
    IoError
  };

  FramingError(Kind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

struct FramingLimits {
  size_t max_header_bytes = 8 * 1024;
  size_t max_body_bytes = 64 * 1024 * 1024;
};

// Compact JSON wrapped in its header, ready for a single write.
std::string encodeFrame(const json::JsonValue& message);

// Writes header and body as one buffer. Callers sharing a sink must
// serialize calls; the child supervisor does this with its write lock.
VoidResult writeFrame(ByteSink& sink, const json::JsonValue& message);

// Throws FramingError on any malformed, truncated or undecodable frame.
json::JsonValue readFrame(ByteSource& source,
                          const FramingLimits& limits = FramingLimits());

}  // namespace codec
}  // namespace relay
