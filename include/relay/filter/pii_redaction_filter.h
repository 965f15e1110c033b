#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "relay/filter/message_filter.h"

namespace relay {
namespace filter {

constexpr const char* kEmailSentinel = "[EMAIL_REDACTED]";
constexpr const char* kPhoneSentinel = "[PHONE_REDACTED]";
constexpr const char* kSsnSentinel = "[SSN_REDACTED]";
constexpr const char* kCreditCardSentinel = "[CREDIT_CARD_REDACTED]";

/**
 * Masks emails, credit-card numbers, SSN-shaped numbers and phone numbers,
 * in that order, with fixed sentinels. Counts per kind are added to
 * |counts| under "email", "credit_card", "ssn" and "phone". Sentinels
 * contain no digits or '@', so redacting twice yields the same text.
 */
std::string redactPii(const std::string& text,
                      const FilterSettings& settings,
                      std::map<std::string, uint64_t>& counts);

class PiiRedactionFilter : public MessageFilter {
 public:
  static constexpr const char* kName = "pii_redactor";

  std::string name() const override { return kName; }
  std::string description() const override {
    return "Redacts emails, phone numbers, SSNs and credit card numbers";
  }
  bool appliesTo(Direction /*direction*/) const override { return true; }

  FilterStatus apply(FilterContext& context, json::JsonValue& message) override;
};

}  // namespace filter
}  // namespace relay
