#include "relay/codec/byte_stream.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace relay {
namespace codec {

Result<size_t> FdByteSource::read(void* buffer, size_t length) {
  while (true) {
    ssize_t n = ::read(fd_, buffer, length);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    Error err;
    err.code = errno;
    err.message = std::string("read failed: ") + strerror(errno);
    return makeError<size_t>(err);
  }
}

Result<size_t> FdByteSink::write(const void* data, size_t length) {
  while (true) {
    ssize_t n = ::write(fd_, data, length);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    Error err;
    err.code = errno;
    err.message = std::string("write failed: ") + strerror(errno);
    return makeError<size_t>(err);
  }
}

VoidResult writeAll(ByteSink& sink, const void* data, size_t length) {
  const char* cursor = static_cast<const char*>(data);
  size_t remaining = length;
  while (remaining > 0) {
    auto result = sink.write(cursor, remaining);
    if (isError(result)) {
      return makeVoidError(errorOf(result));
    }
    size_t written = get<size_t>(result);
    if (written == 0) {
      return makeVoidError(Error(EPIPE, "sink accepted no bytes"));
    }
    cursor += written;
    remaining -= written;
  }
  return makeVoidSuccess();
}

}  // namespace codec
}  // namespace relay
