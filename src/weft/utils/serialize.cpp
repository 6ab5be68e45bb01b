
#include "serialize.hpp"

#include "base-include.hpp"

#include <boost/endian/conversion.hpp>

#include <type_traits>

namespace weft {
// --------------------------------------------------------------------- Helpers

/// @private
template <typename T> static error_code check_ios_ready(T& ios) {
  Expects(uint32_t(ios.exceptions()) == 0);
  if (ios.rdstate() != std::ios_base::goodbit)
    return make_error_code(ecode::stream_not_ready);
  return error_code();
}

/// @private
template <typename T> static error_code check_ios(T& ios) {
  Expects(uint32_t(ios.exceptions()) == 0);
  const auto state = ios.rdstate();
  if (state == std::ios_base::goodbit)
    return error_code();

  if (state & std::ios_base::badbit)
    return make_error_code(ecode::bad);

  if ((state & std::ios_base::eofbit) and (state & std::ios_base::failbit))
    return make_error_code(ecode::premature_eof);

  return make_error_code(ecode::fail);
}

// -------------------------------------------------------------------- integers
/// @private
template <typename T> error_code write_intT(std::ostream& out, T x) {
  static_assert(std::is_integral_v<T>);
  auto ec = check_ios_ready(out);
  if (ec)
    return ec;

  // to little endian
  boost::endian::native_to_little_inplace(x);
  out.write(reinterpret_cast<const char*>(&x), sizeof(x));
  return check_ios(out);
}

/// @private
template <typename T> error_code read_intT(std::istream& in, T& x) {
  static_assert(std::is_integral_v<T>);
  auto ec = check_ios_ready(in);
  if (ec)
    return ec;

  std::array<char, 8> buffer;
  static_assert(sizeof(x) <= buffer.size());

  in.read(&buffer[0], sizeof(x));
  ec = check_ios(in);
  if (ec)
    return ec;
  T value{};
  std::memcpy(&value, &buffer[0], sizeof(value)); // gracefully handle alignment
  boost::endian::little_to_native_inplace(value);
  x = value;
  return ec;
}

/// @ingroup weft-io
error_code write_bool(std::ostream& out, bool x) { return write_intT(out, int8_t(x)); }

/// @ingroup weft-io
error_code write_i8(std::ostream& out, int8_t x) { return write_intT(out, x); }

/// @ingroup weft-io
error_code write_i16(std::ostream& out, int16_t x) { return write_intT(out, x); }

/// @ingroup weft-io
error_code write_i32(std::ostream& out, int32_t x) { return write_intT(out, x); }

/// @ingroup weft-io
error_code write_i64(std::ostream& out, int64_t x) { return write_intT(out, x); }

/// @ingroup weft-io
error_code write_u8(std::ostream& out, uint8_t x) { return write_intT(out, x); }

/// @ingroup weft-io
error_code write_u16(std::ostream& out, uint16_t x) { return write_intT(out, x); }

/// @ingroup weft-io
error_code write_u32(std::ostream& out, uint32_t x) { return write_intT(out, x); }

/// @ingroup weft-io
error_code write_u64(std::ostream& out, uint64_t x) { return write_intT(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, bool x) { return write_bool(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, int8_t x) { return write_i8(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, int16_t x) { return write_i16(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, int32_t x) { return write_i32(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, int64_t x) { return write_i64(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, uint8_t x) { return write_u8(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, uint16_t x) { return write_u16(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, uint32_t x) { return write_u32(out, x); }

/// @ingroup weft-io
error_code write(std::ostream& out, uint64_t x) { return write_u64(out, x); }

/// @ingroup weft-io
error_code read_bool(std::istream& in, bool& x) {
  int8_t y = 0;
  const auto ec = read_i8(in, y);
  if (!ec)
    x = (y != 0);
  return ec;
}

/// @ingroup weft-io
error_code read_i8(std::istream& in, int8_t& x) { return read_intT(in, x); }

/// @ingroup weft-io
error_code read_i16(std::istream& in, int16_t& x) { return read_intT(in, x); }

/// @ingroup weft-io
error_code read_i32(std::istream& in, int32_t& x) { return read_intT(in, x); }

/// @ingroup weft-io
error_code read_i64(std::istream& in, int64_t& x) { return read_intT(in, x); }

/// @ingroup weft-io
error_code read_u8(std::istream& in, uint8_t& x) { return read_intT(in, x); }

/// @ingroup weft-io
error_code read_u16(std::istream& in, uint16_t& x) { return read_intT(in, x); }

/// @ingroup weft-io
error_code read_u32(std::istream& in, uint32_t& x) { return read_intT(in, x); }

/// @ingroup weft-io
error_code read_u64(std::istream& in, uint64_t& x) { return read_intT(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, bool& x) { return read_bool(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, int8_t& x) { return read_i8(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, int16_t& x) { return read_i16(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, int32_t& x) { return read_i32(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, int64_t& x) { return read_i64(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, uint8_t& x) { return read_u8(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, uint16_t& x) { return read_u16(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, uint32_t& x) { return read_u32(in, x); }

/// @ingroup weft-io
error_code read(std::istream& in, uint64_t& x) { return read_u64(in, x); }

// --------------------------------------------------------------------- strings
/// @ingroup weft-io
error_code write(std::ostream& out, std::string_view x) {
  if (x.size() > k_max_string_size)
    return make_error_code(ecode::object_too_large);
  auto ec = write_u32(out, uint32_t(x.size()));
  if (ec)
    return ec;
  out.write(x.data(), std::streamsize(x.size()));
  return check_ios(out);
}

/// @ingroup weft-io
error_code read(std::istream& in, std::string& x) {
  uint32_t sz = 0;
  auto ec = read_u32(in, sz);
  if (ec)
    return ec;
  if (sz > k_max_string_size)
    return make_error_code(ecode::object_too_large);
  try {
    x.resize(sz);
  } catch (const std::bad_alloc&) {
    return make_error_code(ecode::object_too_large);
  }
  in.read(x.data(), std::streamsize(sz));
  return check_ios(in);
}

} // namespace weft
