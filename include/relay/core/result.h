#ifndef RELAY_CORE_RESULT_H
#define RELAY_CORE_RESULT_H

#include <string>
#include <utility>

#include "relay/core/compat.h"

namespace relay {

// Error reported across the control surface and I/O boundaries.
// Codes are listed in relay/core/error_codes.h.
struct Error {
  int code{0};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<T> makeSuccess(T&& value) {
  return Result<T>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  Error err;
  err.code = code;
  err.message = message;
  return Result<T>(err);
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error& errorOf(const Result<T>& result) {
  return get<Error>(result);
}

}  // namespace relay

#endif  // RELAY_CORE_RESULT_H
