#include "relay/filter/metadata_filter.h"

#include <chrono>
#include <ctime>

#include <fmt/format.h>

namespace relay {
namespace filter {

namespace {

// ISO-8601 UTC with milliseconds
std::string isoTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm utc;
  gmtime_r(&seconds, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  return fmt::format("{}.{:03d}Z", buffer, static_cast<int>(ms.count()));
}

}  // namespace

FilterStatus MetadataFilter::apply(FilterContext& context,
                                   json::JsonValue& message) {
  if (!message.isObject()) {
    return FilterStatus::Continue;
  }
  message.set(kMetaKey,
              json::JsonObjectBuilder()
                  .add("ts", isoTimestamp())
                  .add("direction", directionToString(context.direction()))
                  .add("session", context.sessionId())
                  .build());
  context.recordAction(actions::kStamped);
  return FilterStatus::Continue;
}

}  // namespace filter
}  // namespace relay
