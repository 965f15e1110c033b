#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace relay {
namespace broker {

/**
 * Fixed pool of in-flight permits. acquire() polls at a short fixed
 * interval rather than queueing waiters, so it is not fair under
 * saturation.
 */
class InflightGate {
 public:
  explicit InflightGate(size_t permits,
                        std::chrono::milliseconds poll_interval =
                            std::chrono::milliseconds(2))
      : capacity_(permits), poll_interval_(poll_interval) {}

  bool tryAcquire();

  // Returns false, without a permit, once |abort| reads true
  bool acquire(const std::atomic<bool>* abort = nullptr);

  void release();

  size_t inFlight() const { return in_flight_.load(); }
  size_t capacity() const { return capacity_; }
  uint64_t waits() const { return waits_.load(); }

 private:
  const size_t capacity_;
  const std::chrono::milliseconds poll_interval_;
  std::atomic<size_t> in_flight_{0};
  std::atomic<uint64_t> waits_{0};
};

// Releases an acquired permit on scope exit
class PermitGuard {
 public:
  explicit PermitGuard(InflightGate& gate) : gate_(gate) {}
  ~PermitGuard() { gate_.release(); }

  PermitGuard(const PermitGuard&) = delete;
  PermitGuard& operator=(const PermitGuard&) = delete;

 private:
  InflightGate& gate_;
};

}  // namespace broker
}  // namespace relay
