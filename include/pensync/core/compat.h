#ifndef PENSYNC_CORE_COMPAT_H
#define PENSYNC_CORE_COMPAT_H

// Vocabulary types used across the library. The project is built as C++17,
// so these resolve to the standard library implementations.

#include <optional>
#include <variant>

namespace pensync {

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

// Builds a visitor out of a set of lambdas, used to match event variants
// exhaustively.
template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace pensync

#endif  // PENSYNC_CORE_COMPAT_H
