#pragma once

#include <chrono>
#include <string>

#include "relay/core/result.h"
#include "relay/json/json_bridge.h"

namespace relay {
namespace process {

enum class InboxStatus { Ok, Timeout, Closed };

/**
 * The broker's view of the bridged process: one serialized writer and one
 * inbox of decoded frames. Closed means the read loop has ended for good.
 */
class ProcessEndpoint {
 public:
  virtual ~ProcessEndpoint() = default;

  virtual VoidResult writeJSON(const json::JsonValue& message) = 0;

  virtual InboxStatus nextMessage(json::JsonValue& out,
                                  std::chrono::milliseconds timeout) = 0;

  // Why the inbox closed; empty while the process is healthy
  virtual std::string exitReason() const = 0;
};

}  // namespace process
}  // namespace relay
