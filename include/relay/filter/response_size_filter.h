#pragma once

#include <string>

#include "relay/filter/message_filter.h"

namespace relay {
namespace filter {

constexpr const char* kSummarizedPrefix = "[SUMMARIZED] ";
constexpr const char* kTruncatedMarker = "[TRUNCATED]";

/**
 * Keeps responses within the configured size, measured as the total code
 * points of every string value in the message.
 *
 *   total <= summarize_threshold        unchanged
 *   total <= max_response_length        each long string (more than
 *                                       summarize_min_length code points,
 *                                       more than three ". " sentences) is
 *                                       cut to first, middle and last
 *                                       sentence
 *   total >  max_response_length        strings are kept in document order
 *                                       until the budget runs out; the
 *                                       string that exhausts it ends with
 *                                       [TRUNCATED], later ones become ""
 *
 * Truncation keeps the total at or below max_response_length, marker
 * included.
 */
class ResponseSizeFilter : public MessageFilter {
 public:
  static constexpr const char* kName = "response_size";

  std::string name() const override { return kName; }
  std::string description() const override {
    return "Summarizes or truncates oversized responses";
  }
  bool appliesTo(Direction direction) const override {
    return direction == Direction::ServerToClient;
  }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override;

  // Extractive summary of one string; returns it unchanged when too short
  static std::string summarize(const std::string& text, size_t min_length);
};

}  // namespace filter
}  // namespace relay
