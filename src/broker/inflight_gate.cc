#include "relay/broker/inflight_gate.h"

#include <thread>

namespace relay {
namespace broker {

bool InflightGate::tryAcquire() {
  size_t current = in_flight_.load();
  while (current < capacity_) {
    if (in_flight_.compare_exchange_weak(current, current + 1)) {
      return true;
    }
  }
  return false;
}

bool InflightGate::acquire(const std::atomic<bool>* abort) {
  bool waited = false;
  while (!tryAcquire()) {
    if (abort && abort->load()) {
      return false;
    }
    if (!waited) {
      waits_++;
      waited = true;
    }
    std::this_thread::sleep_for(poll_interval_);
  }
  return true;
}

void InflightGate::release() {
  size_t current = in_flight_.load();
  while (current > 0 &&
         !in_flight_.compare_exchange_weak(current, current - 1)) {
  }
}

}  // namespace broker
}  // namespace relay
