#pragma once

#include <cstddef>

#include "relay/core/result.h"

namespace relay {
namespace codec {

// Blocking byte input. read() returns 0 on end of stream.
class ByteSource {
 public:
  virtual ~ByteSource() = default;
  virtual Result<size_t> read(void* buffer, size_t length) = 0;
};

// Blocking byte output. write() may accept fewer bytes than offered.
class ByteSink {
 public:
  virtual ~ByteSink() = default;
  virtual Result<size_t> write(const void* data, size_t length) = 0;
};

// Non-owning views over pipe/file descriptors; EINTR is retried.
class FdByteSource : public ByteSource {
 public:
  explicit FdByteSource(int fd) : fd_(fd) {}
  Result<size_t> read(void* buffer, size_t length) override;
  int fd() const { return fd_; }

 private:
  int fd_;
};

class FdByteSink : public ByteSink {
 public:
  explicit FdByteSink(int fd) : fd_(fd) {}
  Result<size_t> write(const void* data, size_t length) override;
  int fd() const { return fd_; }

 private:
  int fd_;
};

// Loops until every byte is written or the sink fails.
VoidResult writeAll(ByteSink& sink, const void* data, size_t length);

}  // namespace codec
}  // namespace relay
