#pragma once

#include "relay/filter/message_filter.h"

namespace relay {
namespace filter {

// Adds `bridge_meta: {ts, direction, session}` to object messages. Output
// depends on time and session, so it runs after the cache.
class MetadataFilter : public MessageFilter {
 public:
  static constexpr const char* kName = "metadata_stamper";
  static constexpr const char* kMetaKey = "bridge_meta";

  std::string name() const override { return kName; }
  std::string description() const override {
    return "Stamps messages with timestamp, direction and session";
  }
  bool appliesTo(Direction /*direction*/) const override { return true; }
  bool enabledByDefault() const override { return false; }
  bool cacheable() const override { return false; }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override;
};

}  // namespace filter
}  // namespace relay
