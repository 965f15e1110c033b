#include "relay/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <fmt/format.h>

namespace relay {
namespace logging {

static std::string formatTimestamp(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << '[' << formatTimestamp(msg.timestamp) << "] ";
  oss << '[' << logLevelToString(msg.level) << "] ";

  if (msg.component != Component::Root) {
    oss << '[' << componentToString(msg.component);
    if (!msg.component_name.empty()) {
      oss << '.' << msg.component_name;
    }
    oss << "] ";
  }

  oss << '[' << msg.logger_name << "] ";

  if (!msg.session_id.empty()) {
    oss << "[session:" << msg.session_id << "] ";
  }
  if (!msg.request_id.empty()) {
    oss << "[req:" << msg.request_id << "] ";
  }
  if (!msg.direction.empty()) {
    oss << '[' << msg.direction << "] ";
  }
  if (!msg.filter_name.empty()) {
    oss << "[filter:" << msg.filter_name << "] ";
  }

  oss << msg.message;

  if (msg.file && msg.line > 0 && msg.level >= LogLevel::Error) {
    oss << " (" << msg.file << ':' << msg.line << ')';
  }

  if (!msg.key_values.empty()) {
    oss << " {";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first)
        oss << ", ";
      oss << kv.first << "=" << kv.second;
      first = false;
    }
    oss << "}";
  }

  return oss.str();
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  std::string out;
  out.reserve(128 + msg.message.size());

  out += fmt::format("{{\"timestamp\":\"{}\",\"level\":\"{}\",\"logger\":\"{}\"",
                     formatTimestamp(msg.timestamp),
                     logLevelToString(msg.level), escapeJson(msg.logger_name));

  if (msg.process_id > 0) {
    out += fmt::format(",\"pid\":{}", msg.process_id);
  }
  if (msg.component != Component::Root) {
    out += fmt::format(",\"component\":\"{}\"",
                       componentToString(msg.component));
  }
  if (msg.file) {
    out += fmt::format(",\"file\":\"{}\",\"line\":{}", escapeJson(msg.file),
                       msg.line);
  }

  auto addField = [&](const char* key, const std::string& value) {
    if (!value.empty()) {
      out += fmt::format(",\"{}\":\"{}\"", key, escapeJson(value));
    }
  };
  addField("session_id", msg.session_id);
  addField("request_id", msg.request_id);
  addField("direction", msg.direction);
  addField("filter", msg.filter_name);

  out += fmt::format(",\"message\":\"{}\"", escapeJson(msg.message));

  if (!msg.key_values.empty()) {
    out += ",\"metadata\":{";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first)
        out += ",";
      out += fmt::format("\"{}\":\"{}\"", escapeJson(kv.first),
                         escapeJson(kv.second));
      first = false;
    }
    out += "}";
  }

  out += "}";
  return out;
}

std::string JsonFormatter::escapeJson(const std::string& str) const {
  std::string out;
  out.reserve(str.size());

  for (char c : str) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
          // UTF-8 continuation bytes pass through untouched
          out += c;
        }
        break;
    }
  }
  return out;
}

}  // namespace logging
}  // namespace relay
