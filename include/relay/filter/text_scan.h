#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>

#include "relay/core/compat.h"

namespace relay {
namespace filter {

// Single-pass helpers for the pattern-shaped transforms. Every scanner
// built on them does bounded work per input byte, so message size never
// turns into recursion depth.

// ASCII word characters, the same set as \w
inline bool isWordChar(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return u < 0x80 && (std::isalnum(u) || c == '_');
}

inline bool isDigitChar(char c) { return c >= '0' && c <= '9'; }

inline bool isAlphaChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool isSpaceChar(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

// True when a word starts at |pos|: a word character with none before it
inline bool wordStartsAt(const std::string& text, size_t pos) {
  return pos < text.size() && isWordChar(text[pos]) &&
         (pos == 0 || !isWordChar(text[pos - 1]));
}

// True when no word character follows |pos|
inline bool wordEndsAt(const std::string& text, size_t pos) {
  return pos >= text.size() || !isWordChar(text[pos]);
}

// Length of the run of |count| digits at |pos|, or 0
inline size_t digitsAt(const std::string& text, size_t pos, size_t count) {
  if (pos + count > text.size()) {
    return 0;
  }
  for (size_t i = 0; i < count; ++i) {
    if (!isDigitChar(text[pos + i])) {
      return 0;
    }
  }
  return count;
}

// Case-insensitive ASCII prefix test
inline bool matchesAt(const std::string& text, size_t pos, const char* word) {
  for (size_t i = 0; word[i] != '\0'; ++i) {
    if (pos + i >= text.size() ||
        std::tolower(static_cast<unsigned char>(text[pos + i])) !=
            static_cast<unsigned char>(word[i])) {
      return false;
    }
  }
  return true;
}

struct TextSpan {
  size_t begin;
  size_t end;
};

/**
 * Replaces every match of |find| with |replacement|, scanning left to right.
 *
 * |find(text, pos, floor)| returns the match that the scan reaches at |pos|,
 * if any. A match may begin before |pos| but never before |floor|, the end
 * of the previous replacement, and must end after |pos|. Returns the number
 * of replacements.
 */
template <typename Finder>
uint64_t replaceSpans(std::string& text, Finder find,
                      const char* replacement) {
  std::string out;
  size_t copied = 0;
  size_t pos = 0;
  uint64_t count = 0;
  while (pos < text.size()) {
    optional<TextSpan> span = find(text, pos, copied);
    if (!span) {
      ++pos;
      continue;
    }
    out.append(text, copied, span->begin - copied);
    out += replacement;
    copied = span->end;
    pos = span->end;
    ++count;
  }
  if (count > 0) {
    out.append(text, copied, std::string::npos);
    text.swap(out);
  }
  return count;
}

}  // namespace filter
}  // namespace relay
