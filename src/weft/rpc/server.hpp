
#pragma once

#include "connection.hpp"
#include "message.hpp"
#include "transport/boxed.hpp"
#include "transport/mapped.hpp"

#include "weft/utils/base-include.hpp"
#include "weft/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace weft::rpc {

namespace detail {
  template <typename T> struct is_expected : std::false_type {};
  template <typename T> struct is_expected<tl::expected<T, std::error_code>> : std::true_type {};

  template <typename T> struct unwrap_expected { using type = T; };
  template <typename T> struct unwrap_expected<tl::expected<T, std::error_code>> {
    using type = T;
  };

  template <typename T> struct is_optional : std::false_type {};
  template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
} // namespace detail

/**
 * @ingroup rpc
 * @brief A pull-based sequence of `T`: `next()` yields `std::optional<T>`, or
 *        `std::optional<expected<T, error_code>>` when producing can fail, and `std::nullopt`
 *        at the end.
 */
template <typename Src, typename T>
concept ItemSource = requires(Src source) {
  { source.next() } -> std::same_as<std::optional<T>>;
} || requires(Src source) {
  { source.next() } -> std::same_as<Received<T>>;
};

/** @ingroup rpc @brief The updates of a call, as received by its handler */
template <typename T, typename E>
using UpdateStream = MappedRecvStream<T, typename E::In, typename E::RecvStream>;

// ---------------------------------------------------------------------------------- RpcChannel

/**
 * @ingroup rpc
 * @brief The server side of one accepted call, for service `S` over endpoint `E`.
 *
 * A channel is consumed by exactly one dispatch (or `map`). Handlers are invoked as
 * `std::invoke(handler, state, request [, updates])`, so `handler` can be a member function
 * pointer of `state`'s type. Handlers return their result directly, or as
 * `expected<_, error_code>`; a handler that throws a `std::exception` fails the call with
 * `ecode::handler_error`. The dispatch methods return the first error they meet; a peer that
 * leaves while a stream is being produced is a normal end.
 */
template <typename S, typename E> class RpcChannel {
  static_assert(Service<S>);
  static_assert(ChannelTypes<E>);
  static_assert(std::same_as<typename E::In, typename S::Req>);
  static_assert(std::same_as<typename E::Out, typename S::Res>);

private:
  typename E::SendSink send_;
  typename E::RecvStream recv_;

public:
  using ServiceType = S;

  RpcChannel(typename E::SendSink send, typename E::RecvStream recv)
      : send_{std::move(send)}, recv_{std::move(recv)} {}

  /** @brief Run `handler`, and send its response */
  template <typename M, typename State, typename F>
  requires UnaryMsg<M, S> std::error_code dispatch_unary(M request, State state, F handler) &&;

  /** @brief Run `handler`, and forward every item of the sequence it returns */
  template <typename M, typename State, typename F>
  requires ServerStreamingMsg<M, S> std::error_code dispatch_server_streaming(M request,
                                                                               State state,
                                                                               F handler) &&;

  /** @brief Run `handler` over the call's updates, and send its response */
  template <typename M, typename State, typename F>
  requires ClientStreamingMsg<M, S> std::error_code dispatch_client_streaming(M request,
                                                                               State state,
                                                                               F handler) &&;

  /** @brief Run `handler` over the call's updates, and forward the sequence it returns */
  template <typename M, typename State, typename F>
  requires BidiStreamingMsg<M, S> std::error_code dispatch_bidi_streaming(M request, State state,
                                                                           F handler) &&;

  /**
   * @brief The same call, viewed as a call of the sub-service `SNext`.
   */
  template <typename SNext>
  requires ServiceMappable<S, SNext>
      RpcChannel<SNext, MappedConnection<typename SNext::Req, typename SNext::Res, E>> map() && {
    using Mapped = MappedConnection<typename SNext::Req, typename SNext::Res, E>;
    return RpcChannel<SNext, Mapped>{typename Mapped::SendSink{std::move(send_)},
                                     typename Mapped::RecvStream{std::move(recv_)}};
  }
};

// ----------------------------------------------------------------------------------- RpcServer

/**
 * @ingroup rpc
 * @brief Typed server of service `S` over endpoint `E`.
 */
template <typename S, typename E = BoxedServiceEndpoint<S>> class RpcServer {
  static_assert(Service<S>, "S must name distinct Req and Res message enumerations");
  static_assert(ServiceEndpoint<E, S>, "E must be an endpoint carrying S's messages");

private:
  E source_;

public:
  using ServiceType = S;
  using EndpointType = E;
  using Accepted = std::pair<typename S::Req, RpcChannel<S, E>>;

  explicit RpcServer(E source) : source_{std::move(source)} {}

  const E& endpoint() const { return source_; }

  /**
   * @brief Wait for the next call, and read its first message.
   *
   * Fails with `ecode::endpoint_closed` when no further calls can arrive, and with
   * `ecode::connection_closed` when a client hung up before sending its request.
   */
  tl::expected<Accepted, std::error_code> accept() const;

  /** @brief The same server over a type erased endpoint */
  RpcServer<S, BoxedServiceEndpoint<S>> boxed() const {
    return RpcServer<S, BoxedServiceEndpoint<S>>{box_endpoint(source_)};
  }
};

} // namespace weft::rpc

#include "impl/server_impl.hpp"
