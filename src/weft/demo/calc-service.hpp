
#pragma once

#include "weft/rpc/client.hpp"
#include "weft/rpc/message.hpp"
#include "weft/rpc/server.hpp"
#include "weft/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <type_traits>
#include <variant>
#include <vector>

/**
 * @defgroup demo Demo Services
 * @ingroup weft
 *
 * Small services that exercise every interaction pattern, and compose into one app:
 * `app` = `inner` + app version, and `inner` = `calc` + `clock`.
 */

/**
 * Arithmetic service: one call of every pattern.
 */
namespace weft::demo::calc {

struct Service;

// -------------------------------------------------------------------------------------- Messages

struct AddResponse {
  int64_t value{0};
  bool operator==(const AddResponse&) const = default;
};

/** @brief `a + b` */
struct AddRequest {
  using Service = calc::Service;
  using Pattern = rpc::Unary;
  using Response = AddResponse;

  int64_t a{0};
  int64_t b{0};
  bool operator==(const AddRequest&) const = default;
};

struct SumResponse {
  int64_t value{0};
  bool operator==(const SumResponse&) const = default;
};

struct SumUpdate {
  int64_t value{0};
  bool operator==(const SumUpdate&) const = default;
};

/** @brief The sum of every update */
struct SumRequest {
  using Service = calc::Service;
  using Pattern = rpc::ClientStreaming;
  using Response = SumResponse;
  using Update = SumUpdate;

  bool operator==(const SumRequest&) const = default;
};

struct MultiplyResponse {
  int64_t value{0};
  bool operator==(const MultiplyResponse&) const = default;
};

struct MultiplyUpdate {
  int64_t value{0};
  bool operator==(const MultiplyUpdate&) const = default;
};

/** @brief Every update, multiplied by `factor` */
struct MultiplyRequest {
  using Service = calc::Service;
  using Pattern = rpc::BidiStreaming;
  using Response = MultiplyResponse;
  using Update = MultiplyUpdate;

  int64_t factor{1};
  bool operator==(const MultiplyRequest&) const = default;
};

struct FibonacciResponse {
  uint64_t value{0};
  bool operator==(const FibonacciResponse&) const = default;
};

/** @brief The first `n` Fibonacci numbers: 0, 1, 1, 2, 3, ... */
struct FibonacciRequest {
  using Service = calc::Service;
  using Pattern = rpc::ServerStreaming;
  using Response = FibonacciResponse;

  uint32_t n{0};
  bool operator==(const FibonacciRequest&) const = default;
};

struct Service {
  using Req = std::variant<AddRequest, SumRequest, SumUpdate, MultiplyRequest, MultiplyUpdate,
                           FibonacciRequest>;
  using Res = std::variant<AddResponse, SumResponse, MultiplyResponse, FibonacciResponse>;
};

// ----------------------------------------------------------------------------------------- Codec

error_code write(std::ostream& out, const AddRequest& x);
error_code write(std::ostream& out, const AddResponse& x);
error_code write(std::ostream& out, const SumRequest& x);
error_code write(std::ostream& out, const SumUpdate& x);
error_code write(std::ostream& out, const SumResponse& x);
error_code write(std::ostream& out, const MultiplyRequest& x);
error_code write(std::ostream& out, const MultiplyUpdate& x);
error_code write(std::ostream& out, const MultiplyResponse& x);
error_code write(std::ostream& out, const FibonacciRequest& x);
error_code write(std::ostream& out, const FibonacciResponse& x);

error_code read(std::istream& in, AddRequest& x);
error_code read(std::istream& in, AddResponse& x);
error_code read(std::istream& in, SumRequest& x);
error_code read(std::istream& in, SumUpdate& x);
error_code read(std::istream& in, SumResponse& x);
error_code read(std::istream& in, MultiplyRequest& x);
error_code read(std::istream& in, MultiplyUpdate& x);
error_code read(std::istream& in, MultiplyResponse& x);
error_code read(std::istream& in, FibonacciRequest& x);
error_code read(std::istream& in, FibonacciResponse& x);

// --------------------------------------------------------------------------------------- Sources

/**
 * @brief Produces the Fibonacci sequence, `n` numbers long.
 */
class FibonacciSource {
private:
  uint32_t remaining_;
  uint64_t current_{0};
  uint64_t next_{1};

public:
  explicit FibonacciSource(uint32_t n) : remaining_{n} {}
  std::optional<FibonacciResponse> next();
};

/**
 * @brief Multiplies each update of a bidi call as it arrives.
 */
template <typename Updates> class MultiplySource {
private:
  Updates updates_;
  int64_t factor_;

public:
  MultiplySource(Updates updates, int64_t factor)
      : updates_{std::move(updates)}, factor_{factor} {}

  rpc::Received<MultiplyResponse> next() {
    auto update = updates_.next();
    if (!update)
      return std::nullopt;
    if (!*update)
      return rpc::Received<MultiplyResponse>{std::in_place, tl::make_unexpected(update->error())};
    MultiplyResponse response;
    if (__builtin_mul_overflow((*update)->value, factor_, &response.value)) {
      return rpc::Received<MultiplyResponse>{
          std::in_place, tl::make_unexpected(make_error_code(ecode::argument_error))};
    }
    return rpc::Received<MultiplyResponse>{std::in_place, response};
  }
};

// --------------------------------------------------------------------------------------- Handler

/**
 * @brief Serves calc calls. Stateless; copies are interchangeable.
 */
class Handler {
public:
  /** @brief Fails with `argument_error` if the sum overflows */
  tl::expected<AddResponse, error_code> add(AddRequest request) const;
  FibonacciSource fibonacci(FibonacciRequest request) const;

  template <typename Updates>
  tl::expected<SumResponse, error_code> sum(SumRequest, Updates updates) const {
    SumResponse response;
    for (auto update = updates.next(); update; update = updates.next()) {
      if (!*update)
        return tl::make_unexpected(update->error());
      if (__builtin_add_overflow(response.value, (*update)->value, &response.value))
        return tl::make_unexpected(make_error_code(ecode::argument_error));
    }
    return response;
  }

  template <typename Updates>
  MultiplySource<Updates> multiply(MultiplyRequest request, Updates updates) const {
    return MultiplySource<Updates>{std::move(updates), request.factor};
  }

  template <typename E>
  error_code handle_rpc_request(Service::Req request, rpc::RpcChannel<Service, E> channel) const {
    return std::visit(
        [this, &channel](auto&& msg) -> error_code {
          using T = std::decay_t<decltype(msg)>;
          if constexpr (std::is_same_v<T, AddRequest>) {
            return std::move(channel).dispatch_unary(std::move(msg), *this, &Handler::add);
          } else if constexpr (std::is_same_v<T, SumRequest>) {
            return std::move(channel).dispatch_client_streaming(
                std::move(msg), *this, [](const Handler& self, SumRequest req, auto updates) {
                  return self.sum(std::move(req), std::move(updates));
                });
          } else if constexpr (std::is_same_v<T, MultiplyRequest>) {
            return std::move(channel).dispatch_bidi_streaming(
                std::move(msg), *this, [](const Handler& self, MultiplyRequest req, auto updates) {
                  return self.multiply(std::move(req), std::move(updates));
                });
          } else if constexpr (std::is_same_v<T, FibonacciRequest>) {
            return std::move(channel).dispatch_server_streaming(std::move(msg), *this,
                                                                &Handler::fibonacci);
          } else {
            // an update can't start a call
            return make_error_code(ecode::unexpected_message);
          }
        },
        std::move(request));
  }
};

// ---------------------------------------------------------------------------------------- Client

/**
 * @brief Typed calc client, built from a client of any service that embeds calc.
 */
template <typename SOuter, typename C> class Client {
public:
  using RpcClientType =
      rpc::RpcClient<Service, rpc::MappedConnection<Service::Res, Service::Req, C>>;

private:
  RpcClientType rpc_;

public:
  explicit Client(const rpc::RpcClient<SOuter, C>& outer)
      : rpc_{outer.template map<Service>()} {}

  const RpcClientType& rpc() const { return rpc_; }

  tl::expected<int64_t, error_code> add(int64_t a, int64_t b) const {
    auto response = rpc_.unary_call(AddRequest{a, b});
    if (!response)
      return tl::make_unexpected(response.error());
    return response->value;
  }

  tl::expected<int64_t, error_code> sum(const std::vector<int64_t>& values) const {
    auto call = rpc_.client_streaming_call(SumRequest{});
    if (!call)
      return tl::make_unexpected(call.error());
    for (auto value : values)
      if (auto ec = call->send(SumUpdate{value}))
        return tl::make_unexpected(ec);
    auto response = std::move(*call).finish();
    if (!response)
      return tl::make_unexpected(response.error());
    return response->value;
  }

  tl::expected<std::vector<uint64_t>, error_code> fibonacci(uint32_t n) const {
    auto stream = rpc_.server_streaming_call(FibonacciRequest{n});
    if (!stream)
      return tl::make_unexpected(stream.error());
    std::vector<uint64_t> values;
    for (auto item = stream->next(); item; item = stream->next()) {
      if (!*item)
        return tl::make_unexpected(item->error());
      values.push_back((*item)->value);
    }
    return values;
  }

  /** @brief Opens a bidi multiply call; use its `updates` and `responses` directly */
  auto multiply(int64_t factor) const { return rpc_.bidi_call(MultiplyRequest{factor}); }
};

} // namespace weft::demo::calc
