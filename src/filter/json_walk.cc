#include "relay/filter/json_walk.h"

namespace relay {
namespace filter {

namespace {

size_t transformAt(json::JsonValue& value,
                   const StringTransform& transform,
                   size_t depth,
                   size_t max_depth) {
  if (value.isString()) {
    std::string original = value.getString();
    std::string replaced = transform(original);
    if (replaced == original) {
      return 0;
    }
    value = json::JsonValue(replaced);
    return 1;
  }
  if (depth >= max_depth) {
    return 0;
  }

  size_t changed = 0;
  if (value.isArray()) {
    for (size_t i = 0; i < value.size(); ++i) {
      json::JsonValue child = value.at(i);
      size_t n = transformAt(child, transform, depth + 1, max_depth);
      if (n > 0) {
        value.setAt(i, child);
        changed += n;
      }
    }
  } else if (value.isObject()) {
    for (const auto& key : value.keys()) {
      json::JsonValue child = value.at(key);
      size_t n = transformAt(child, transform, depth + 1, max_depth);
      if (n > 0) {
        value.set(key, child);
        changed += n;
      }
    }
  }
  return changed;
}

bool collectAt(const json::JsonValue& value,
               std::vector<std::string>& out,
               size_t depth,
               size_t max_depth) {
  if (value.isString()) {
    out.push_back(value.getString());
    return true;
  }
  if (!value.isArray() && !value.isObject()) {
    return true;
  }
  if (depth >= max_depth) {
    return value.empty();
  }
  if (value.isArray()) {
    for (size_t i = 0; i < value.size(); ++i) {
      if (!collectAt(value.at(i), out, depth + 1, max_depth)) {
        return false;
      }
    }
  } else {
    for (const auto& key : value.keys()) {
      if (!collectAt(value.at(key), out, depth + 1, max_depth)) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace

size_t transformStrings(json::JsonValue& value,
                        const StringTransform& transform,
                        size_t max_depth) {
  return transformAt(value, transform, 0, max_depth);
}

bool collectStrings(const json::JsonValue& value,
                    std::vector<std::string>& out,
                    size_t max_depth) {
  return collectAt(value, out, 0, max_depth);
}

size_t utf8Length(const std::string& text) {
  size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

size_t utf8Offset(const std::string& text, size_t count) {
  size_t seen = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if ((c & 0xC0) != 0x80) {
      if (seen == count) {
        return i;
      }
      ++seen;
    }
  }
  return text.size();
}

}  // namespace filter
}  // namespace relay
