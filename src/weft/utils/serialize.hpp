
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include "error-codes.hpp"

/**
 * @defgroup weft-io Input/Output
 * @ingroup weft-utils
 *
 * Binary encoding of fundamental values. Integers are written little-endian
 * at their natural width, strings as a `u32` length followed by the bytes.
 * Every function reports failure as an `error_code`; streams must not have
 * exceptions enabled.
 */

namespace weft {

/// @ingroup weft-io
/// @brief Strings longer than this are refused on read, so corrupt length prefixes can't exhaust
///        memory.
constexpr std::size_t k_max_string_size = 16 * 1024 * 1024;

// ----------------------------------------------------------- Fundamental Types

error_code write_bool(std::ostream& out, bool x);
error_code write_i8(std::ostream& out, int8_t x);
error_code write_i16(std::ostream& out, int16_t x);
error_code write_i32(std::ostream& out, int32_t x);
error_code write_i64(std::ostream& out, int64_t x);
error_code write_u8(std::ostream& out, uint8_t x);
error_code write_u16(std::ostream& out, uint16_t x);
error_code write_u32(std::ostream& out, uint32_t x);
error_code write_u64(std::ostream& out, uint64_t x);

error_code write(std::ostream& out, bool x);
error_code write(std::ostream& out, int8_t x);
error_code write(std::ostream& out, int16_t x);
error_code write(std::ostream& out, int32_t x);
error_code write(std::ostream& out, int64_t x);
error_code write(std::ostream& out, uint8_t x);
error_code write(std::ostream& out, uint16_t x);
error_code write(std::ostream& out, uint32_t x);
error_code write(std::ostream& out, uint64_t x);

error_code read_bool(std::istream& in, bool& x);
error_code read_i8(std::istream& in, int8_t& x);
error_code read_i16(std::istream& in, int16_t& x);
error_code read_i32(std::istream& in, int32_t& x);
error_code read_i64(std::istream& in, int64_t& x);
error_code read_u8(std::istream& in, uint8_t& x);
error_code read_u16(std::istream& in, uint16_t& x);
error_code read_u32(std::istream& in, uint32_t& x);
error_code read_u64(std::istream& in, uint64_t& x);

error_code read(std::istream& in, bool& x);
error_code read(std::istream& in, int8_t& x);
error_code read(std::istream& in, int16_t& x);
error_code read(std::istream& in, int32_t& x);
error_code read(std::istream& in, int64_t& x);
error_code read(std::istream& in, uint8_t& x);
error_code read(std::istream& in, uint16_t& x);
error_code read(std::istream& in, uint32_t& x);
error_code read(std::istream& in, uint64_t& x);

// ---------------------------------------------------------------------- String

error_code write(std::ostream& out, std::string_view x);
error_code read(std::istream& in, std::string& x);

} // namespace weft
