#pragma once

#include <cstdint>
#include <string>

#include "relay/filter/message_filter.h"

namespace relay {
namespace filter {

constexpr const char* kSecretSentinel = "[REDACTED]";

// Replaces credential-shaped substrings (key/token assignments, sk- keys,
// AWS access key ids) with [REDACTED]. |masked| receives the match count.
std::string maskSecrets(const std::string& text, uint64_t& masked);

class SecretMaskFilter : public MessageFilter {
 public:
  static constexpr const char* kName = "secret_masker";

  std::string name() const override { return kName; }
  std::string description() const override {
    return "Masks API keys, tokens and cloud access key ids";
  }
  bool appliesTo(Direction /*direction*/) const override { return true; }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override;
};

}  // namespace filter
}  // namespace relay
