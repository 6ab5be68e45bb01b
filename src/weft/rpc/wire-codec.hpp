
#pragma once

#include "weft/utils/base-include.hpp"
#include "weft/utils/error-codes.hpp"
#include "weft/utils/serialize.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

namespace weft {

// ------------------------------------------------------------------------------------- Variants
//
// A variant is written as its `u32` alternative index, followed by the alternative. Message
// types provide their own `write`/`read` overloads, found by argument dependent lookup.

template <typename... Ts> error_code write(std::ostream& out, const std::variant<Ts...>& value);
template <typename... Ts> error_code read(std::istream& in, std::variant<Ts...>& value);

namespace detail {
  template <std::size_t I, typename... Ts>
  error_code read_alternative_(std::istream& in, uint32_t index, std::variant<Ts...>& value) {
    if constexpr (I == sizeof...(Ts)) {
      return make_error_code(ecode::invalid_data);
    } else {
      if (index != I)
        return read_alternative_<I + 1>(in, index, value);
      std::variant_alternative_t<I, std::variant<Ts...>> x{};
      if (auto ec = read(in, x))
        return ec;
      value.template emplace<I>(std::move(x));
      return {};
    }
  }
} // namespace detail

/** @ingroup weft-io */
template <typename... Ts> error_code write(std::ostream& out, const std::variant<Ts...>& value) {
  if (value.valueless_by_exception())
    return make_error_code(ecode::invalid_data);
  if (auto ec = write_u32(out, uint32_t(value.index())))
    return ec;
  return std::visit([&out](const auto& x) { return write(out, x); }, value);
}

/** @ingroup weft-io */
template <typename... Ts> error_code read(std::istream& in, std::variant<Ts...>& value) {
  uint32_t index = 0;
  if (auto ec = read_u32(in, index))
    return ec;
  return detail::read_alternative_<0>(in, index, value);
}

} // namespace weft

namespace weft::rpc::wire {

/** @brief One encoded message */
using FrameType = std::string;

/**
 * @brief Encode `value` into a single frame.
 * Fails with `ecode::serialization_error`.
 */
template <typename T> tl::expected<FrameType, std::error_code> encode_frame(const T& value) {
  std::ostringstream out;
  if (auto ec = write(out, value)) {
    TRACE("failed to encode frame: {}", ec.message());
    return tl::make_unexpected(make_error_code(ecode::serialization_error));
  }
  return out.str();
}

/**
 * @brief Decode a frame that holds exactly one `T`.
 * Fails with `ecode::serialization_error` on truncated, corrupt, or trailing bytes.
 */
template <typename T> tl::expected<T, std::error_code> decode_frame(std::string_view frame) {
  std::istringstream in{std::string{frame}};
  T value{};
  if (auto ec = read(in, value)) {
    TRACE("failed to decode frame: {}", ec.message());
    return tl::make_unexpected(make_error_code(ecode::serialization_error));
  }
  if (in.peek() != std::istringstream::traits_type::eof()) {
    TRACE("frame has {} trailing bytes", frame.size() - std::size_t(in.tellg()));
    return tl::make_unexpected(make_error_code(ecode::serialization_error));
  }
  return value;
}

} // namespace weft::rpc::wire
