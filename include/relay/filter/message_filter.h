/**
 * @file message_filter.h
 * @brief Interface shared by every transform in the filter pipeline
 *
 * A filter sees one message for one (direction, session) pair and either
 * lets it continue (possibly rewritten in place) or stops the chain by
 * blocking it. Filters are stateless with respect to configuration: the
 * snapshot they must honor travels in the FilterContext.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "relay/filter/filter_config.h"
#include "relay/json/json_bridge.h"

namespace relay {
namespace filter {

enum class Direction { ClientToServer, ServerToClient };

inline const char* directionToString(Direction direction) {
  return direction == Direction::ClientToServer ? "client_to_server"
                                                : "server_to_client";
}

enum class FilterStatus {
  Continue,      // Hand the message to the next filter
  StopIteration  // Message blocked; the chain ends here
};

// Names recorded in FilterResult::actions_taken
namespace actions {
constexpr const char* kRateLimited = "rate_limited";
constexpr const char* kBlacklisted = "blacklisted";
constexpr const char* kSanitized = "html_sanitized";
constexpr const char* kPiiRedacted = "pii_redacted";
constexpr const char* kSecretsMasked = "secrets_masked";
constexpr const char* kSummarized = "summarized";
constexpr const char* kTruncated = "truncated";
constexpr const char* kStamped = "metadata_stamped";
constexpr const char* kCacheHit = "cache_hit";
}  // namespace actions

struct FilterResult {
  json::JsonValue message;
  bool blocked{false};
  std::string block_reason;
  std::string blocked_by;
  std::vector<std::string> actions_taken;
  std::map<std::string, uint64_t> redaction_counts;
  bool from_cache{false};
  uint64_t config_version{0};
};

class FilterContext {
 public:
  FilterContext(Direction direction,
                const std::string& session_id,
                FilterConfigPtr config)
      : direction_(direction),
        session_id_(session_id),
        config_(std::move(config)) {}

  Direction direction() const { return direction_; }
  const std::string& sessionId() const { return session_id_; }
  const FilterConfig& config() const { return *config_; }
  const FilterSettings& settings() const { return config_->settings(); }

  void block(const std::string& reason) {
    blocked_ = true;
    block_reason_ = reason;
  }
  bool blocked() const { return blocked_; }
  const std::string& blockReason() const { return block_reason_; }

  void recordAction(const std::string& action) { actions_.push_back(action); }
  void addRedactions(const std::string& kind, uint64_t count) {
    if (count > 0) {
      redactions_[kind] += count;
    }
  }

  const std::vector<std::string>& actions() const { return actions_; }
  const std::map<std::string, uint64_t>& redactions() const {
    return redactions_;
  }

  // Undo everything a faulted filter recorded
  struct Checkpoint {
    size_t action_count;
    std::map<std::string, uint64_t> redactions;
  };
  Checkpoint checkpoint() const { return Checkpoint{actions_.size(), redactions_}; }
  void restore(const Checkpoint& checkpoint) {
    actions_.resize(checkpoint.action_count);
    redactions_ = checkpoint.redactions;
    blocked_ = false;
    block_reason_.clear();
  }

 private:
  const Direction direction_;
  const std::string session_id_;
  const FilterConfigPtr config_;

  bool blocked_{false};
  std::string block_reason_;
  std::vector<std::string> actions_;
  std::map<std::string, uint64_t> redactions_;
};

class MessageFilter {
 public:
  virtual ~MessageFilter() = default;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  virtual bool appliesTo(Direction direction) const = 0;

  // Used when the snapshot carries no override for name()
  virtual bool enabledByDefault() const { return true; }

  // Result depends only on message content and config, never on session
  // or time. Only cacheable filters run before the cache.
  virtual bool cacheable() const { return true; }

  /**
   * Rewrites |message| in place or blocks it through context.block().
   * Exceptions escaping apply() are treated as a filter fault: the pipeline
   * logs them and continues with the message as it was before this filter.
   */
  virtual FilterStatus apply(FilterContext& context,
                             json::JsonValue& message) = 0;
};

using MessageFilterPtr = std::unique_ptr<MessageFilter>;

}  // namespace filter
}  // namespace relay
