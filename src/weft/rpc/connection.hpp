
#pragma once

#include "message.hpp"

#include "weft/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <concepts>
#include <optional>
#include <utility>

namespace weft::rpc {

/**
 * @ingroup rpc
 * @brief One item from a receive stream: `std::nullopt` at end-of-stream, otherwise a value
 *        or the error that ended the stream.
 */
template <typename T> using Received = std::optional<tl::expected<T, std::error_code>>;

/**
 * @ingroup rpc
 * @brief Accepts values of `T` until closed. `send` blocks while the transport applies
 *        backpressure, and fails once the peer is gone.
 */
template <typename K, typename T>
concept SendSinkFor = std::movable<K> && requires(K sink, T value) {
  { sink.send(std::move(value)) } -> std::same_as<std::error_code>;
  sink.close();
};

/**
 * @ingroup rpc
 * @brief Yields values of `T` in the order the peer sent them.
 */
template <typename R, typename T>
concept RecvStreamFor = std::movable<R> && requires(R stream) {
  { stream.next() } -> std::same_as<Received<T>>;
};

/**
 * @ingroup rpc
 * @brief The parts shared by connections and endpoints: an inbound type `In`, an outbound
 *        type `Out`, and the two halves of a channel.
 */
template <typename C>
concept ChannelTypes = requires {
  typename C::In;
  typename C::Out;
  typename C::SendSink;
  typename C::RecvStream;
} && SendSinkFor<typename C::SendSink, typename C::Out> &&
    RecvStreamFor<typename C::RecvStream, typename C::In>;

/**
 * @ingroup rpc
 * @brief Both halves of one channel.
 */
template <typename C>
using SocketOf = std::pair<typename C::SendSink, typename C::RecvStream>;

/**
 * @ingroup rpc
 * @brief The client side of a transport: a cheap to copy handle that opens channels.
 *
 * Channels opened from one connection are independent: dropping or closing one never affects
 * another.
 */
template <typename C>
concept Connection = ChannelTypes<C> && std::copy_constructible<C> && requires(const C& c) {
  { c.open() } -> std::same_as<tl::expected<SocketOf<C>, std::error_code>>;
};

/**
 * @ingroup rpc
 * @brief The server side of a transport: yields the channels that clients open.
 *
 * `accept` fails with `ecode::endpoint_closed` once every connection handle has gone, and
 * no further channels can arrive.
 */
template <typename E>
concept Endpoint = ChannelTypes<E> && requires(const E& e) {
  { e.accept() } -> std::same_as<tl::expected<SocketOf<E>, std::error_code>>;
};

/** @ingroup rpc @brief A connection whose message types are those of a client of `S` */
template <typename C, typename S>
concept ServiceConnection = Connection<C> && Service<S> &&
    std::same_as<typename C::In, typename S::Res> && std::same_as<typename C::Out, typename S::Req>;

/** @ingroup rpc @brief An endpoint whose message types are those of a server of `S` */
template <typename E, typename S>
concept ServiceEndpoint = Endpoint<E> && Service<S> &&
    std::same_as<typename E::In, typename S::Req> && std::same_as<typename E::Out, typename S::Res>;

} // namespace weft::rpc
