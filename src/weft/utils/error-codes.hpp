
#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup weft-utils
 *
 * Every fallible operation in weft reports a `std::error_code` in the
 * `ecode` category, either directly or through `expected<T, error_code>`.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The peer hung up before answering
 * return make_unexpected(make_error_code(ecode::connection_closed));
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace weft {
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of weft error codes.
 */
enum class ecode : int {
  okay = 0,           //!< i.e., everything's okay.
  logic_error,        //!< Faulty logic in the program.
  exception_occurred, //!< Exception caught and forwarded as an error_code.
  argument_error,     //!< An invalid argument was supplied.

  stream_not_ready, //!< I/O stream is not ready.
  premature_eof,    //!< I/O stream encountered premature end-of-file.
  fail,             //!< I/O stream set the `fail` bit.
  bad,              //!< I/O stream set the `bad` bit.
  object_too_large, //!< Attempt to read/write an object that is too large.
  invalid_data,     //!< Input data (file/network/etc.) was invalid.

  transport_error,     //!< Send/receive failed at the substrate.
  serialization_error, //!< A value could not be encoded or decoded.
  connection_closed,   //!< The peer ended the channel before protocol completion.
  endpoint_closed,     //!< The endpoint will accept no more channels.
  mapping_error,       //!< A message does not belong to the (mapped) service.
  unexpected_message,  //!< A call began with a message that can't start a call.
  handler_error        //!< Application handler logic failed.
};
} // namespace weft

namespace std {
template <> struct is_error_code_enum<weft::ecode> : true_type {};
} // namespace std

namespace weft {
error_code make_error_code(ecode);
} // namespace weft
