#pragma once

#include <map>
#include <string>

#include "relay/config/bridge_config.h"
#include "relay/core/result.h"

namespace relay {
namespace server {

// Request headers as presented by the outer transport; names are matched
// case-insensitively.
using Credentials = std::map<std::string, std::string>;

/**
 * Pass/fail check for the outer surface. Bearer mode expects
 * "Authorization: Bearer <secret>", apikey mode "X-API-Key: <secret>".
 * Secrets are compared in constant time.
 */
class AuthGate {
 public:
  explicit AuthGate(const config::AuthConfig& config) : config_(config) {}

  VoidResult authorize(const Credentials& credentials) const;

  config::AuthMode mode() const { return config_.mode; }

 private:
  const config::AuthConfig config_;
};

}  // namespace server
}  // namespace relay
