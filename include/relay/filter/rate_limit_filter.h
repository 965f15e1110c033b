/**
 * @file rate_limit_filter.h
 * @brief Per-session token bucket on the client-to-server path
 *
 * Each session gets a bucket of `burst` tokens refilled at
 * `requests_per_second`. A submission without a token is blocked.
 * Disabled unless the snapshot enables "rate_limiter".
 */

#pragma once

#include <chrono>
#include <map>
#include <mutex>

#include "relay/filter/message_filter.h"

namespace relay {
namespace filter {

class RateLimitFilter : public MessageFilter {
 public:
  static constexpr const char* kName = "rate_limiter";

  std::string name() const override { return kName; }
  std::string description() const override {
    return "Per-session token bucket limiting client submissions";
  }
  bool appliesTo(Direction direction) const override {
    return direction == Direction::ClientToServer;
  }
  bool enabledByDefault() const override { return false; }
  bool cacheable() const override { return false; }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override;

 private:
  struct Bucket {
    double tokens;
    std::chrono::steady_clock::time_point last_refill;
  };

  bool allowRequest(const std::string& session_id,
                    const RateLimitSettings& settings);
  void pruneIdleBuckets(std::chrono::steady_clock::time_point now);

  std::mutex mutex_;
  std::map<std::string, Bucket> buckets_;
};

}  // namespace filter
}  // namespace relay
