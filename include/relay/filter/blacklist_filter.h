#pragma once

#include "relay/filter/message_filter.h"

namespace relay {
namespace filter {

// Blocks client submissions whose string content mentions a blocked domain
// or keyword (case-insensitive substring) or matches a blocked pattern.
// Messages nested deeper than max_depth are blocked outright.
class BlacklistFilter : public MessageFilter {
 public:
  static constexpr const char* kName = "blacklist";

  std::string name() const override { return kName; }
  std::string description() const override {
    return "Blocks requests mentioning blocked domains, keywords or patterns";
  }
  bool appliesTo(Direction direction) const override {
    return direction == Direction::ClientToServer;
  }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override;
};

}  // namespace filter
}  // namespace relay
