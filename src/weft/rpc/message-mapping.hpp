
#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

/**
 * @defgroup rpc RPC
 * @ingroup weft
 *
 * Typed request/response messaging over any transport that moves whole messages, with four
 * interaction patterns (unary, server streaming, client streaming, bidirectional streaming),
 * and services that compose into larger services.
 */

namespace weft::rpc {

namespace detail {
  template <typename T, typename... Ts>
  constexpr std::size_t count_of_v = (std::size_t(std::is_same_v<T, Ts>) + ... + std::size_t(0));

  template <typename V> struct has_unique_alternatives : std::true_type {};
  template <typename... Ts>
  struct has_unique_alternatives<std::variant<Ts...>>
      : std::bool_constant<((count_of_v<Ts, Ts...> == 1) && ...)> {};
} // namespace detail

/**
 * @ingroup rpc
 * @brief Total widening of `Inner` into `Outer`, and partial narrowing back.
 *
 * Provided for identity, and for any `std::variant` that holds `Inner` exactly once. Specialize
 * it for other message enumerations:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * template <> struct weft::rpc::MessageMapping<MyRequest, AddRequest> {
 *   static MyRequest widen(AddRequest&& x);
 *   static std::optional<AddRequest> narrow(MyRequest&& x);
 * };
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * `narrow(widen(x))` must give back `x`, and narrowing a value that was not widened from
 * `Inner` must give `std::nullopt`.
 */
template <typename Outer, typename Inner> struct MessageMapping {};

template <typename T> struct MessageMapping<T, T> {
  static T widen(T&& x) { return std::move(x); }
  static std::optional<T> narrow(T&& x) { return std::optional<T>{std::move(x)}; }
};

template <typename... Ts, typename Inner>
requires(detail::count_of_v<Inner, Ts...> == 1) struct MessageMapping<std::variant<Ts...>, Inner> {
  using Outer = std::variant<Ts...>;

  static Outer widen(Inner&& x) { return Outer{std::in_place_type<Inner>, std::move(x)}; }

  static std::optional<Inner> narrow(Outer&& x) {
    if (auto* value = std::get_if<Inner>(&x))
      return std::optional<Inner>{std::move(*value)};
    return std::nullopt;
  }
};

/**
 * @ingroup rpc
 * @brief `Inner` is a member of the message enumeration `Outer`.
 */
template <typename Outer, typename Inner>
concept Mappable = requires(Outer outer, Inner inner) {
  { MessageMapping<Outer, Inner>::widen(std::move(inner)) } -> std::same_as<Outer>;
  { MessageMapping<Outer, Inner>::narrow(std::move(outer)) } -> std::same_as<std::optional<Inner>>;
};

/** @ingroup rpc */
template <typename Outer, typename Inner>
requires Mappable<Outer, Inner> Outer widen(Inner x) {
  return MessageMapping<Outer, Inner>::widen(std::move(x));
}

/** @ingroup rpc */
template <typename Inner, typename Outer>
requires Mappable<Outer, Inner> std::optional<Inner> narrow(Outer x) {
  return MessageMapping<Outer, Inner>::narrow(std::move(x));
}

} // namespace weft::rpc
