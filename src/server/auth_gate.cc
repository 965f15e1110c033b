#include "relay/server/auth_gate.h"

#include <cctype>

#include "relay/core/crypto_utils.h"
#include "relay/core/error_codes.h"

#define RELAY_LOG_COMPONENT "server.auth"
#include "relay/logging/log_macros.h"

namespace relay {
namespace server {

namespace {

std::string toLower(std::string text) {
  for (auto& c : text) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return text;
}

bool findHeader(const Credentials& credentials,
                const std::string& name,
                std::string& value) {
  for (const auto& header : credentials) {
    if (toLower(header.first) == name) {
      value = header.second;
      return true;
    }
  }
  return false;
}

VoidResult denied(const std::string& why) {
  RELAY_LOG(Warning, "authorization failed: {}", why);
  return makeVoidError(Error(errors::kUnauthorized, "unauthorized"));
}

}  // namespace

VoidResult AuthGate::authorize(const Credentials& credentials) const {
  std::string presented;
  switch (config_.mode) {
    case config::AuthMode::None:
      return makeVoidSuccess();

    case config::AuthMode::Bearer: {
      std::string header;
      if (!findHeader(credentials, "authorization", header)) {
        return denied("missing Authorization header");
      }
      static const std::string kScheme = "bearer ";
      if (header.size() <= kScheme.size() ||
          toLower(header.substr(0, kScheme.size())) != kScheme) {
        return denied("Authorization header is not a bearer token");
      }
      presented = header.substr(kScheme.size());
      break;
    }

    case config::AuthMode::ApiKey:
      if (!findHeader(credentials, "x-api-key", presented)) {
        return denied("missing X-API-Key header");
      }
      break;
  }

  if (config_.secret.empty() ||
      !crypto::constantTimeEquals(presented, config_.secret)) {
    return denied("credential mismatch");
  }
  return makeVoidSuccess();
}

}  // namespace server
}  // namespace relay
