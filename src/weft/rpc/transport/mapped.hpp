
#pragma once

#include "weft/rpc/connection.hpp"
#include "weft/rpc/message-mapping.hpp"
#include "weft/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <utility>

namespace weft::rpc {

// ------------------------------------------------------------------------------- MappedSendSink

/**
 * @ingroup rpc
 * @brief Widens each `T` into `Outer` before handing it to `Sink`.
 */
template <typename T, typename Outer, typename Sink> class MappedSendSink {
private:
  Sink inner_;

public:
  MappedSendSink() = default;
  explicit MappedSendSink(Sink inner) : inner_{std::move(inner)} {}

  std::error_code send(T value) { return inner_.send(widen<Outer>(std::move(value))); }
  void close() { inner_.close(); }
};

// ----------------------------------------------------------------------------- MappedRecvStream

/**
 * @ingroup rpc
 * @brief Narrows each `Outer` from `Stream` into `T`. A message outside `T` is reported as
 *        `ecode::mapping_error`.
 */
template <typename T, typename Outer, typename Stream> class MappedRecvStream {
private:
  Stream inner_;

public:
  MappedRecvStream() = default;
  explicit MappedRecvStream(Stream inner) : inner_{std::move(inner)} {}

  Received<T> next() {
    auto item = inner_.next();
    if (!item)
      return std::nullopt;
    if (!*item)
      return Received<T>{std::in_place, tl::make_unexpected(item->error())};
    auto value = narrow<T>(std::move(**item));
    if (!value)
      return Received<T>{std::in_place, tl::make_unexpected(make_error_code(ecode::mapping_error))};
    return Received<T>{std::in_place, std::move(*value)};
  }
};

// ----------------------------------------------------------------------------- MappedConnection

/**
 * @ingroup rpc
 * @brief Views a connection (or endpoint) `C` through narrower message types: `In` is
 *        narrowed out of `C::In`, and `Out` is widened into `C::Out`.
 *
 * Used to hand a sub-service a channel of the service it is embedded in.
 */
template <typename InT, typename OutT, typename C>
requires ChannelTypes<C> && Mappable<typename C::In, InT> && Mappable<typename C::Out, OutT>
class MappedConnection {
public:
  using In = InT;
  using Out = OutT;
  using SendSink = MappedSendSink<Out, typename C::Out, typename C::SendSink>;
  using RecvStream = MappedRecvStream<In, typename C::In, typename C::RecvStream>;
  using Socket = std::pair<SendSink, RecvStream>;

private:
  C inner_;

public:
  explicit MappedConnection(C inner) : inner_{std::move(inner)} {}

  tl::expected<Socket, std::error_code> open() const requires Connection<C> {
    auto socket = inner_.open();
    if (!socket)
      return tl::make_unexpected(socket.error());
    return Socket{SendSink{std::move(socket->first)}, RecvStream{std::move(socket->second)}};
  }

  tl::expected<Socket, std::error_code> accept() const requires Endpoint<C> {
    auto socket = inner_.accept();
    if (!socket)
      return tl::make_unexpected(socket.error());
    return Socket{SendSink{std::move(socket->first)}, RecvStream{std::move(socket->second)}};
  }

  const C& inner() const { return inner_; }
};

} // namespace weft::rpc
