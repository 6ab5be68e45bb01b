
#include "error-codes.hpp"

#include <string>

namespace weft {
namespace {
  /**
   * @private
   */
  struct ECodeCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
  };

  /**
   * @private
   */
  const char* ECodeCategory::name() const noexcept { return "weft"; }

  /**
   * @private
   */
  std::string ECodeCategory::message(int e) const {
    switch (static_cast<ecode>(e)) {
    case ecode::okay: return "okay";
    case ecode::logic_error: return "logic error";
    case ecode::exception_occurred: return "exception occurred";
    case ecode::argument_error: return "argument error";
    case ecode::stream_not_ready: return "stream not ready";
    case ecode::premature_eof: return "premature eof";
    case ecode::fail: return "fail";
    case ecode::bad: return "bad";
    case ecode::object_too_large: return "object too large";
    case ecode::invalid_data: return "invalid data";
    case ecode::transport_error: return "transport error";
    case ecode::serialization_error: return "serialization error";
    case ecode::connection_closed: return "connection closed";
    case ecode::endpoint_closed: return "endpoint closed";
    case ecode::mapping_error: return "mapping error";
    case ecode::unexpected_message: return "unexpected message";
    case ecode::handler_error: return "handler error";
    }
    return "(unknown error)";
  }

  /**
   * @private
   */
  static const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

} // namespace weft
