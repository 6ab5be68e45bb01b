
#pragma once

#include "connection.hpp"
#include "message.hpp"
#include "transport/boxed.hpp"
#include "transport/mapped.hpp"

#include "weft/utils/base-include.hpp"
#include "weft/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <utility>

namespace weft::rpc {

// ------------------------------------------------------------------------------ ResponseStream

/**
 * @ingroup rpc
 * @brief The responses of a streaming call, in the order the server produced them.
 *
 * Ends with `std::nullopt` once the server finishes, or with a single error item (after which
 * it only returns `std::nullopt`). Dropping the stream ends the call; the server sees its next
 * send fail, and stops producing.
 */
template <typename T, typename C> class ResponseStream {
private:
  std::optional<typename C::SendSink> keep_alive_;
  typename C::RecvStream recv_;
  bool is_done_{false};

public:
  explicit ResponseStream(typename C::RecvStream recv,
                          std::optional<typename C::SendSink> keep_alive = std::nullopt)
      : keep_alive_{std::move(keep_alive)}, recv_{std::move(recv)} {}

  Received<T> next();

  /** @brief true once the stream has ended */
  bool is_done() const { return is_done_; }
};

// --------------------------------------------------------------------------------- UpdateSink

/**
 * @ingroup rpc
 * @brief Sends the updates of a client-streaming or bidi call.
 *
 * `close` (or destruction) tells the server that no more updates will come.
 */
template <typename T, typename C> class UpdateSink {
private:
  typename C::SendSink send_;

public:
  explicit UpdateSink(typename C::SendSink send) : send_{std::move(send)} {}

  /** @brief Fails once the server has stopped listening */
  std::error_code send(T update) { return send_.send(widen<typename C::Out>(std::move(update))); }

  void close() { send_.close(); }
};

// ------------------------------------------------------------------------- ClientStreamingCall

/**
 * @ingroup rpc
 * @brief An open client-streaming call: send updates, then `finish` for the single response.
 */
template <typename M, typename C> class ClientStreamingCall {
private:
  UpdateSink<UpdateOf<M>, C> updates_;
  typename C::RecvStream recv_;

public:
  ClientStreamingCall(typename C::SendSink send, typename C::RecvStream recv)
      : updates_{std::move(send)}, recv_{std::move(recv)} {}

  std::error_code send(UpdateOf<M> update) { return updates_.send(std::move(update)); }

  /** @brief Close the update stream, and wait for the response */
  tl::expected<ResponseOf<M>, std::error_code> finish() &&;
};

// --------------------------------------------------------------------------- BidiStreamingCall

/**
 * @ingroup rpc
 * @brief An open bidirectional call. `updates` and `responses` are independent, and may be
 *        used from different threads.
 */
template <typename M, typename C> struct BidiStreamingCall {
  UpdateSink<UpdateOf<M>, C> updates;
  ResponseStream<ResponseOf<M>, C> responses;
};

// ----------------------------------------------------------------------------------- RpcClient

/**
 * @ingroup rpc
 * @brief Typed client of service `S` over connection `C`.
 *
 * Every call opens its own channel, and leaves it when the call completes, so calls from
 * several threads never interfere. The client is cheap to copy.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto [endpoint, conn] = mem::connection<calc::Request, calc::Response>();
 * RpcClient<calc::Service, decltype(conn)> client{conn};
 * auto sum = client.unary_call(calc::AddRequest{40, 2}); // sum->value == 42
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
template <typename S, typename C = BoxedServiceConnection<S>> class RpcClient {
  static_assert(Service<S>, "S must name distinct Req and Res message enumerations");
  static_assert(ServiceConnection<C, S>, "C must be a connection carrying S's messages");

private:
  C source_;

public:
  using ServiceType = S;
  using ConnectionType = C;

  explicit RpcClient(C source) : source_{std::move(source)} {}

  const C& connection() const { return source_; }

  /**
   * @brief Send `request`, and wait for its single response.
   * Fails with `ecode::connection_closed` if the server hangs up without answering, and
   * `ecode::mapping_error` if it answers with a response that isn't `ResponseOf<M>`.
   */
  template <typename M>
  requires UnaryMsg<M, S> tl::expected<ResponseOf<M>, std::error_code> unary_call(M request) const;

  /** @brief Send `request`, and receive a stream of responses */
  template <typename M>
  requires ServerStreamingMsg<M, S>
      tl::expected<ResponseStream<ResponseOf<M>, C>, std::error_code>
      server_streaming_call(M request) const;

  /** @brief Send `request`; updates and the final response go through the returned call */
  template <typename M>
  requires ClientStreamingMsg<M, S>
      tl::expected<ClientStreamingCall<M, C>, std::error_code>
      client_streaming_call(M request) const;

  /** @brief Send `request`; updates and responses then flow independently */
  template <typename M>
  requires BidiStreamingMsg<M, S>
      tl::expected<BidiStreamingCall<M, C>, std::error_code> bidi_call(M request) const;

  /**
   * @brief A client of the sub-service `SNext`, sharing this client's connection.
   */
  template <typename SNext>
  requires ServiceMappable<S, SNext>
      RpcClient<SNext, MappedConnection<typename SNext::Res, typename SNext::Req, C>> map() const {
    using Mapped = MappedConnection<typename SNext::Res, typename SNext::Req, C>;
    return RpcClient<SNext, Mapped>{Mapped{source_}};
  }

  /** @brief The same client over a type erased connection */
  RpcClient<S, BoxedServiceConnection<S>> boxed() const {
    return RpcClient<S, BoxedServiceConnection<S>>{box_connection(source_)};
  }

private:
  tl::expected<SocketOf<C>, std::error_code> open_with_(typename S::Req request) const;
};

} // namespace weft::rpc

#include "impl/client_impl.hpp"
