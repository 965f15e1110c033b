#ifndef RELAY_CORE_COMPAT_H
#define RELAY_CORE_COMPAT_H

// The relay is built as C++17; these aliases keep the vocabulary types
// unqualified inside namespace relay.

#include <cstddef>
#include <optional>
#include <variant>

namespace relay {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace relay

#endif  // RELAY_CORE_COMPAT_H
