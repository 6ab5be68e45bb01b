
#include "stdinc.hpp"

#include "calc-service.hpp"

#include "weft/utils/serialize.hpp"

namespace weft::demo::calc {

// ----------------------------------------------------------------------------------------- Codec

error_code write(std::ostream& out, const AddRequest& x) {
  if (auto ec = weft::write_i64(out, x.a))
    return ec;
  return weft::write_i64(out, x.b);
}

error_code read(std::istream& in, AddRequest& x) {
  if (auto ec = weft::read_i64(in, x.a))
    return ec;
  return weft::read_i64(in, x.b);
}

error_code write(std::ostream&, const SumRequest&) { return {}; }
error_code read(std::istream&, SumRequest&) { return {}; }

error_code write(std::ostream& out, const MultiplyRequest& x) {
  return weft::write_i64(out, x.factor);
}
error_code read(std::istream& in, MultiplyRequest& x) { return weft::read_i64(in, x.factor); }

error_code write(std::ostream& out, const FibonacciRequest& x) { return weft::write_u32(out, x.n); }
error_code read(std::istream& in, FibonacciRequest& x) { return weft::read_u32(in, x.n); }

error_code write(std::ostream& out, const AddResponse& x) { return weft::write_i64(out, x.value); }
error_code read(std::istream& in, AddResponse& x) { return weft::read_i64(in, x.value); }

error_code write(std::ostream& out, const SumUpdate& x) { return weft::write_i64(out, x.value); }
error_code read(std::istream& in, SumUpdate& x) { return weft::read_i64(in, x.value); }

error_code write(std::ostream& out, const SumResponse& x) { return weft::write_i64(out, x.value); }
error_code read(std::istream& in, SumResponse& x) { return weft::read_i64(in, x.value); }

error_code write(std::ostream& out, const MultiplyUpdate& x) {
  return weft::write_i64(out, x.value);
}
error_code read(std::istream& in, MultiplyUpdate& x) { return weft::read_i64(in, x.value); }

error_code write(std::ostream& out, const MultiplyResponse& x) {
  return weft::write_i64(out, x.value);
}
error_code read(std::istream& in, MultiplyResponse& x) { return weft::read_i64(in, x.value); }

error_code write(std::ostream& out, const FibonacciResponse& x) {
  return weft::write_u64(out, x.value);
}
error_code read(std::istream& in, FibonacciResponse& x) { return weft::read_u64(in, x.value); }

// --------------------------------------------------------------------------------------- Sources

std::optional<FibonacciResponse> FibonacciSource::next() {
  if (remaining_ == 0)
    return std::nullopt;
  --remaining_;
  FibonacciResponse response{current_};
  const auto sum = current_ + next_;
  current_ = next_;
  next_ = sum;
  return response;
}

// --------------------------------------------------------------------------------------- Handler

tl::expected<AddResponse, error_code> Handler::add(AddRequest request) const {
  TRACE("add({}, {})", request.a, request.b);
  AddResponse response;
  if (__builtin_add_overflow(request.a, request.b, &response.value))
    return tl::make_unexpected(make_error_code(ecode::argument_error));
  return response;
}

FibonacciSource Handler::fibonacci(FibonacciRequest request) const {
  TRACE("fibonacci({})", request.n);
  return FibonacciSource{request.n};
}

} // namespace weft::demo::calc
