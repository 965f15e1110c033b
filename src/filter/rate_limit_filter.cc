#include "relay/filter/rate_limit_filter.h"

#include <algorithm>

#define RELAY_LOG_COMPONENT "filter.rate_limiter"
#include "relay/logging/log_macros.h"

namespace relay {
namespace filter {

namespace {

// Buckets untouched for this long are full again and can be recreated
constexpr std::chrono::minutes kIdleBucketAge{10};
constexpr size_t kPruneThreshold = 1024;

}  // namespace

FilterStatus RateLimitFilter::apply(FilterContext& context,
                                    json::JsonValue& /*message*/) {
  if (allowRequest(context.sessionId(), context.settings().rate_limit)) {
    return FilterStatus::Continue;
  }
  context.recordAction(actions::kRateLimited);
  context.block("rate limit exceeded");

  logging::LogContext ctx;
  ctx.session_id = context.sessionId();
  ctx.filter_name = kName;
  RELAY_LOG_WITH_CONTEXT(Warning, ctx, "rate limit exceeded ({}/s, burst {})",
                         context.settings().rate_limit.requests_per_second,
                         context.settings().rate_limit.burst);
  return FilterStatus::StopIteration;
}

bool RateLimitFilter::allowRequest(const std::string& session_id,
                                   const RateLimitSettings& settings) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = std::chrono::steady_clock::now();
  double capacity = static_cast<double>(settings.burst);

  auto it = buckets_.find(session_id);
  if (it == buckets_.end()) {
    if (buckets_.size() >= kPruneThreshold) {
      pruneIdleBuckets(now);
    }
    it = buckets_.emplace(session_id, Bucket{capacity, now}).first;
  }

  // Refill tokens based on time elapsed
  Bucket& bucket = it->second;
  std::chrono::duration<double> elapsed = now - bucket.last_refill;
  bucket.tokens = std::min(
      capacity, bucket.tokens + elapsed.count() * settings.requests_per_second);
  bucket.last_refill = now;

  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    return true;
  }
  return false;
}

void RateLimitFilter::pruneIdleBuckets(
    std::chrono::steady_clock::time_point now) {
  for (auto it = buckets_.begin(); it != buckets_.end();) {
    if (now - it->second.last_refill > kIdleBucketAge) {
      it = buckets_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace filter
}  // namespace relay
