#include "relay/codec/framing.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#define RELAY_LOG_COMPONENT "codec"
#include "relay/logging/log_macros.h"

namespace relay {
namespace codec {

namespace {

constexpr char kHeaderTerminator[] = "\r\n\r\n";
constexpr size_t kHeaderTerminatorLength = 4;

std::string trim(const std::string& value) {
  size_t begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return std::string();
  }
  size_t end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool endsWithTerminator(const std::string& header) {
  return header.size() >= kHeaderTerminatorLength &&
         header.compare(header.size() - kHeaderTerminatorLength,
                        kHeaderTerminatorLength, kHeaderTerminator) == 0;
}

std::string readHeaderBlock(ByteSource& source, const FramingLimits& limits) {
  std::string header;
  char byte = 0;
  while (!endsWithTerminator(header)) {
    auto result = source.read(&byte, 1);
    if (isError(result)) {
      throw FramingError(FramingError::Kind::IoError, errorOf(result).message);
    }
    if (get<size_t>(result) == 0) {
      if (header.empty()) {
        throw FramingError(FramingError::Kind::EndOfStream,
                           "end of stream before frame header");
      }
      throw FramingError(FramingError::Kind::TruncatedHeader,
                         "end of stream inside frame header");
    }
    header.push_back(byte);
    if (header.size() > limits.max_header_bytes) {
      throw FramingError(
          FramingError::Kind::HeaderTooLarge,
          fmt::format("frame header exceeds {} bytes", limits.max_header_bytes));
    }
  }
  header.resize(header.size() - kHeaderTerminatorLength);
  return header;
}

size_t parseContentLength(const std::string& header,
                          const FramingLimits& limits) {
  bool found = false;
  std::string raw_length;

  size_t start = 0;
  while (start <= header.size()) {
    size_t end = header.find("\r\n", start);
    if (end == std::string::npos) {
      end = header.size();
    }
    std::string line = header.substr(start, end - start);
    start = end + 2;

    if (line.empty()) {
      continue;
    }
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      throw FramingError(FramingError::Kind::MalformedHeader,
                         fmt::format("malformed header line: '{}'", line));
    }
    if (toLower(trim(line.substr(0, colon))) == "content-length") {
      raw_length = trim(line.substr(colon + 1));
      found = true;
    }
  }

  if (!found) {
    throw FramingError(FramingError::Kind::MissingContentLength,
                       "missing Content-Length header");
  }
  if (raw_length.empty() ||
      !std::all_of(raw_length.begin(), raw_length.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    throw FramingError(
        FramingError::Kind::InvalidContentLength,
        fmt::format("invalid Content-Length value: '{}'", raw_length));
  }

  size_t length = 0;
  for (char c : raw_length) {
    size_t digit = static_cast<size_t>(c - '0');
    if (length > (limits.max_body_bytes - digit) / 10) {
      throw FramingError(
          FramingError::Kind::FrameTooLarge,
          fmt::format("Content-Length {} exceeds limit of {} bytes",
                      raw_length, limits.max_body_bytes));
    }
    length = length * 10 + digit;
  }
  return length;
}

}  // namespace

std::string encodeFrame(const json::JsonValue& message) {
  std::string body = message.toString();
  std::string frame = fmt::format("Content-Length: {}\r\n\r\n", body.size());
  frame += body;
  return frame;
}

VoidResult writeFrame(ByteSink& sink, const json::JsonValue& message) {
  std::string frame = encodeFrame(message);
  return writeAll(sink, frame.data(), frame.size());
}

json::JsonValue readFrame(ByteSource& source, const FramingLimits& limits) {
  std::string header = readHeaderBlock(source, limits);
  size_t length = parseContentLength(header, limits);

  std::string body(length, '\0');
  size_t received = 0;
  while (received < length) {
    auto result = source.read(&body[received], length - received);
    if (isError(result)) {
      throw FramingError(FramingError::Kind::IoError, errorOf(result).message);
    }
    size_t n = get<size_t>(result);
    if (n == 0) {
      throw FramingError(
          FramingError::Kind::TruncatedBody,
          fmt::format("end of stream after {} of {} body bytes", received,
                      length));
    }
    received += n;
  }

  try {
    return json::JsonValue::parse(body);
  } catch (const json::JsonException& e) {
    RELAY_LOG(Debug, "undecodable frame body ({} bytes)", length);
    throw FramingError(FramingError::Kind::InvalidJson, e.what());
  }
}

}  // namespace codec
}  // namespace relay
