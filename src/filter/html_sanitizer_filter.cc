#include "relay/filter/html_sanitizer_filter.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <vector>

#include "relay/filter/json_walk.h"

#define RELAY_LOG_COMPONENT "filter.html_sanitizer"
#include "relay/logging/log_macros.h"

namespace relay {
namespace filter {

namespace {

struct Attribute {
  std::string name;
  bool has_value{false};
  std::string value;
};

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
         c == ':';
}

bool startsWith(const std::string& text, size_t pos, const char* prefix) {
  return text.compare(pos, std::char_traits<char>::length(prefix), prefix) ==
         0;
}

// Elements dropped together with everything up to their closing tag
bool removesContent(const std::string& tag, const HtmlSanitizeOptions& options) {
  static const std::set<std::string> kAlways = {"script", "style", "iframe",
                                                "object"};
  if (kAlways.count(tag)) {
    return true;
  }
  return options.remove_ads && (tag == "ins" || tag == "aside");
}

// Void elements that are dropped without touching what follows
bool removesTagOnly(const std::string& tag, const HtmlSanitizeOptions& options) {
  return tag == "embed" || (options.remove_tracking && tag == "img");
}

bool isUrlAttribute(const std::string& name) {
  static const std::set<std::string> kUrlAttributes = {
      "href", "src", "action", "formaction", "xlink:href", "background",
      "poster", "srcset", "data"};
  return kUrlAttributes.count(name) > 0;
}

bool isUnsafeUrl(const std::string& value) {
  // Browsers ignore embedded whitespace and control characters in schemes
  std::string compact;
  for (unsigned char c : value) {
    if (c > 0x20 && c != 0x7f) {
      compact.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return startsWith(compact, 0, "javascript:") ||
         startsWith(compact, 0, "data:") || startsWith(compact, 0, "vbscript:");
}

bool isDangerousAttribute(const Attribute& attr) {
  std::string name = toLower(attr.name);
  if (name.size() > 2 && name.compare(0, 2, "on") == 0) {
    return true;
  }
  if (name == "style") {
    return true;
  }
  return attr.has_value && isUrlAttribute(name) && isUnsafeUrl(attr.value);
}

std::vector<Attribute> parseAttributes(const std::string& body,
                                       bool& self_closing) {
  std::vector<Attribute> attributes;
  self_closing = false;
  size_t i = 0;
  const size_t n = body.size();

  while (i < n) {
    while (i < n && isSpace(body[i])) {
      ++i;
    }
    if (i >= n) {
      break;
    }
    if (body[i] == '/') {
      self_closing = true;
      ++i;
      continue;
    }
    self_closing = false;

    size_t name_start = i;
    while (i < n && !isSpace(body[i]) && body[i] != '=' && body[i] != '/') {
      ++i;
    }
    Attribute attr;
    attr.name = body.substr(name_start, i - name_start);

    size_t j = i;
    while (j < n && isSpace(body[j])) {
      ++j;
    }
    if (j < n && body[j] == '=') {
      i = j + 1;
      while (i < n && isSpace(body[i])) {
        ++i;
      }
      attr.has_value = true;
      if (i < n && (body[i] == '"' || body[i] == '\'')) {
        char quote = body[i++];
        size_t value_start = i;
        while (i < n && body[i] != quote) {
          ++i;
        }
        attr.value = body.substr(value_start, i - value_start);
        if (i < n) {
          ++i;
        }
      } else {
        size_t value_start = i;
        while (i < n && !isSpace(body[i])) {
          ++i;
        }
        attr.value = body.substr(value_start, i - value_start);
      }
    }
    if (!attr.name.empty()) {
      attributes.push_back(std::move(attr));
    }
  }
  return attributes;
}

std::string escapeAttributeValue(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '"':
        out += "&quot;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

// Position of the '>' closing the tag opened at |pos|, honoring quoted
// attribute values; npos if the tag is unterminated.
size_t findTagEnd(const std::string& input, size_t pos) {
  char quote = 0;
  for (size_t i = pos; i < input.size(); ++i) {
    char c = input[i];
    if (quote) {
      if (c == quote) {
        quote = 0;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '>') {
      return i;
    }
  }
  return std::string::npos;
}

// Start of the first "</tag" at or after |pos| in the lowercased input
size_t findClosingTag(const std::string& lowered, size_t pos,
                      const std::string& tag) {
  const std::string needle = "</" + tag;
  while (true) {
    size_t found = lowered.find(needle, pos);
    if (found == std::string::npos) {
      return found;
    }
    size_t after = found + needle.size();
    if (after >= lowered.size() || !isNameChar(lowered[after])) {
      return found;
    }
    pos = after;
  }
}

}  // namespace

std::string sanitizeHtml(const std::string& input,
                         const HtmlSanitizeOptions& options) {
  std::string out;
  out.reserve(input.size());

  const std::string lowered = toLower(input);
  const size_t n = input.size();
  size_t pos = 0;

  while (pos < n) {
    size_t lt = input.find('<', pos);
    if (lt == std::string::npos) {
      out.append(input, pos, std::string::npos);
      break;
    }
    out.append(input, pos, lt - pos);
    pos = lt;

    if (startsWith(input, pos, "<!--")) {
      size_t end = input.find("-->", pos + 4);
      pos = (end == std::string::npos) ? n : end + 3;
      continue;
    }

    size_t name_start = pos + 1;
    bool closing = name_start < n && input[name_start] == '/';
    if (closing) {
      ++name_start;
    }
    size_t name_end = name_start;
    while (name_end < n && isNameChar(input[name_end])) {
      ++name_end;
    }
    if (name_end == name_start ||
        !std::isalpha(static_cast<unsigned char>(input[name_start]))) {
      // A bare '<' in text
      out.push_back('<');
      ++pos;
      continue;
    }

    size_t tag_end = findTagEnd(input, name_end);
    if (tag_end == std::string::npos) {
      // Unterminated tag: nothing after it can be trusted
      break;
    }
    std::string raw_name = input.substr(name_start, name_end - name_start);
    std::string tag = toLower(raw_name);
    std::string body = input.substr(name_end, tag_end - name_end);
    pos = tag_end + 1;

    bool self_closing = false;
    std::vector<Attribute> attributes = parseAttributes(body, self_closing);

    if (removesContent(tag, options)) {
      if (!closing && !self_closing) {
        // Element content is raw text; only the matching close tag ends it
        size_t close = findClosingTag(lowered, pos, tag);
        if (close == std::string::npos) {
          break;
        }
        size_t close_end = input.find('>', close);
        pos = (close_end == std::string::npos) ? n : close_end + 1;
      }
      continue;
    }
    if (removesTagOnly(tag, options)) {
      continue;
    }

    if (closing) {
      out += "</" + raw_name + ">";
      continue;
    }

    out += "<" + raw_name;
    for (const auto& attr : attributes) {
      if (isDangerousAttribute(attr)) {
        continue;
      }
      out += " " + attr.name;
      if (attr.has_value) {
        out += "=\"" + escapeAttributeValue(attr.value) + "\"";
      }
    }
    out += self_closing ? " />" : ">";
  }
  return out;
}

std::string collapseWhitespace(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  bool pending_space = false;
  for (char c : input) {
    if (isSpace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

FilterStatus HtmlSanitizerFilter::apply(FilterContext& context,
                                        json::JsonValue& message) {
  const auto& settings = context.settings();
  if (!settings.remove_scripts && !settings.normalize_whitespace) {
    return FilterStatus::Continue;
  }

  HtmlSanitizeOptions options;
  options.remove_tracking = settings.remove_tracking;
  options.remove_ads = settings.remove_ads;

  size_t changed = transformStrings(
      message,
      [&](const std::string& text) {
        std::string result = text;
        if (settings.remove_scripts && result.find('<') != std::string::npos) {
          result = sanitizeHtml(result, options);
        }
        if (settings.normalize_whitespace) {
          result = collapseWhitespace(result);
        }
        return result;
      },
      settings.max_depth);

  if (changed > 0) {
    context.recordAction(actions::kSanitized);
    RELAY_LOG(Debug, "sanitized {} string(s) for session {}", changed,
              context.sessionId());
  }
  return FilterStatus::Continue;
}

}  // namespace filter
}  // namespace relay
