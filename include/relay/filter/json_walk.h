#pragma once

#include <functional>
#include <string>
#include <vector>

#include "relay/json/json_bridge.h"

namespace relay {
namespace filter {

// Depth-bounded traversals over string values (array elements and object
// values; object keys are left alone). Objects are visited in key order.

using StringTransform = std::function<std::string(const std::string&)>;

// Applies |transform| to every string at nesting depth <= max_depth and
// returns how many strings changed. Deeper subtrees are left untouched.
size_t transformStrings(json::JsonValue& value,
                        const StringTransform& transform,
                        size_t max_depth);

// Appends every string value to |out|. Returns false, with |out| partially
// filled, when the tree nests deeper than max_depth.
bool collectStrings(const json::JsonValue& value,
                    std::vector<std::string>& out,
                    size_t max_depth);

// Number of Unicode code points in a UTF-8 string
size_t utf8Length(const std::string& text);

// Byte offset just past the first |count| code points
size_t utf8Offset(const std::string& text, size_t count);

}  // namespace filter
}  // namespace relay
