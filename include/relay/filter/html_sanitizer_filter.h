#pragma once

#include <string>

#include "relay/filter/message_filter.h"

namespace relay {
namespace filter {

struct HtmlSanitizeOptions {
  bool remove_tracking{true};
  bool remove_ads{true};
};

/**
 * Single forward pass over |input|; no regular expressions, no
 * backtracking. Removes script/style/iframe/object/embed elements with
 * their content, HTML comments, event-handler and style attributes, and
 * URL attributes with javascript:, data: or vbscript: schemes. Text
 * outside tags is copied unchanged.
 */
std::string sanitizeHtml(const std::string& input,
                         const HtmlSanitizeOptions& options);

// Collapses whitespace runs to one space and trims both ends
std::string collapseWhitespace(const std::string& input);

class HtmlSanitizerFilter : public MessageFilter {
 public:
  static constexpr const char* kName = "html_sanitizer";

  std::string name() const override { return kName; }
  std::string description() const override {
    return "Strips active HTML content and dangerous attributes from "
           "responses";
  }
  bool appliesTo(Direction direction) const override {
    return direction == Direction::ServerToClient;
  }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override;
};

}  // namespace filter
}  // namespace relay
