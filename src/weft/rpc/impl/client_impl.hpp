
#pragma once

namespace weft::rpc {

namespace detail {
  /**
   * @private
   * @brief Read the single response of a call.
   */
  template <typename T, typename Stream>
  tl::expected<T, std::error_code> recv_response(Stream& stream) {
    auto item = stream.next();
    if (!item)
      return tl::make_unexpected(make_error_code(ecode::connection_closed));
    if (!*item)
      return tl::make_unexpected(item->error());
    auto value = narrow<T>(std::move(**item));
    if (!value)
      return tl::make_unexpected(make_error_code(ecode::mapping_error));
    return std::move(*value);
  }
} // namespace detail

// ---------------------------------------------------------------------------- ResponseStream

template <typename T, typename C> Received<T> ResponseStream<T, C>::next() {
  if (is_done_)
    return std::nullopt;

  auto item = recv_.next();
  if (!item) {
    is_done_ = true;
    return std::nullopt;
  }
  if (!*item) {
    is_done_ = true;
    return Received<T>{std::in_place, tl::make_unexpected(item->error())};
  }

  auto value = narrow<T>(std::move(**item));
  if (!value) {
    is_done_ = true;
    return Received<T>{std::in_place, tl::make_unexpected(make_error_code(ecode::mapping_error))};
  }
  return Received<T>{std::in_place, std::move(*value)};
}

// ------------------------------------------------------------------------ ClientStreamingCall

template <typename M, typename C>
tl::expected<ResponseOf<M>, std::error_code> ClientStreamingCall<M, C>::finish() && {
  updates_.close();
  return detail::recv_response<ResponseOf<M>>(recv_);
}

// --------------------------------------------------------------------------------- RpcClient

template <typename S, typename C>
tl::expected<SocketOf<C>, std::error_code>
RpcClient<S, C>::open_with_(typename S::Req request) const {
  auto socket = source_.open();
  if (!socket) {
    TRACE("failed to open channel: {}", socket.error().message());
    return tl::make_unexpected(socket.error());
  }
  if (auto ec = socket->first.send(std::move(request))) {
    TRACE("failed to send request: {}", ec.message());
    return tl::make_unexpected(ec);
  }
  return socket;
}

template <typename S, typename C>
template <typename M>
requires UnaryMsg<M, S> tl::expected<ResponseOf<M>, std::error_code>
RpcClient<S, C>::unary_call(M request) const {
  auto socket = open_with_(widen<typename S::Req>(std::move(request)));
  if (!socket)
    return tl::make_unexpected(socket.error());
  auto response = detail::recv_response<ResponseOf<M>>(socket->second);
  socket->first.close();
  return response;
}

template <typename S, typename C>
template <typename M>
requires ServerStreamingMsg<M, S> tl::expected<ResponseStream<ResponseOf<M>, C>, std::error_code>
RpcClient<S, C>::server_streaming_call(M request) const {
  auto socket = open_with_(widen<typename S::Req>(std::move(request)));
  if (!socket)
    return tl::make_unexpected(socket.error());
  return ResponseStream<ResponseOf<M>, C>{std::move(socket->second), std::move(socket->first)};
}

template <typename S, typename C>
template <typename M>
requires ClientStreamingMsg<M, S> tl::expected<ClientStreamingCall<M, C>, std::error_code>
RpcClient<S, C>::client_streaming_call(M request) const {
  auto socket = open_with_(widen<typename S::Req>(std::move(request)));
  if (!socket)
    return tl::make_unexpected(socket.error());
  return ClientStreamingCall<M, C>{std::move(socket->first), std::move(socket->second)};
}

template <typename S, typename C>
template <typename M>
requires BidiStreamingMsg<M, S> tl::expected<BidiStreamingCall<M, C>, std::error_code>
RpcClient<S, C>::bidi_call(M request) const {
  auto socket = open_with_(widen<typename S::Req>(std::move(request)));
  if (!socket)
    return tl::make_unexpected(socket.error());
  return BidiStreamingCall<M, C>{UpdateSink<UpdateOf<M>, C>{std::move(socket->first)},
                                 ResponseStream<ResponseOf<M>, C>{std::move(socket->second)}};
}

} // namespace weft::rpc
