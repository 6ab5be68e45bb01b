
#pragma once

namespace weft::rpc {

namespace detail {
  template <typename F, typename... Args>
  using handler_result_t =
      typename unwrap_expected<std::decay_t<std::invoke_result_t<F&, Args...>>>::type;

  /**
   * @private
   * @brief Invoke an application handler; a thrown exception becomes `ecode::handler_error`.
   */
  template <typename F, typename... Args>
  tl::expected<handler_result_t<F, Args...>, std::error_code> invoke_handler(F& handler,
                                                                             Args&&... args) {
    using result_type = std::decay_t<std::invoke_result_t<F&, Args...>>;
    try {
      if constexpr (is_expected<result_type>::value) {
        return std::invoke(handler, std::forward<Args>(args)...);
      } else {
        return tl::expected<result_type, std::error_code>{
            std::invoke(handler, std::forward<Args>(args)...)};
      }
    } catch (const std::exception& e) {
      WARN("rpc handler failed: {}", e.what());
      return tl::make_unexpected(make_error_code(ecode::handler_error));
    }
  }

  /**
   * @private
   * @brief Drain `source` into `sink`, widening each item into `Outer`.
   *
   * Stops without error when the peer stops listening.
   */
  template <typename T, typename Outer, typename Src, typename Sink>
  std::error_code forward_items(Src& source, Sink& sink) {
    static_assert(ItemSource<Src, T>, "handler must return a sequence of the response type");
    for (;;) {
      auto item = [&source]() -> Received<T> {
        try {
          auto x = source.next();
          if (!x)
            return std::nullopt;
          return Received<T>{std::in_place, std::move(*x)};
        } catch (const std::exception& e) {
          WARN("rpc response sequence failed: {}", e.what());
          return Received<T>{std::in_place,
                             tl::make_unexpected(make_error_code(ecode::handler_error))};
        }
      }();

      if (!item)
        return {};
      if (!*item)
        return item->error();
      if (auto ec = sink.send(widen<Outer>(std::move(**item)))) {
        TRACE("peer stopped listening: {}", ec.message());
        return {};
      }
    }
  }
} // namespace detail

// --------------------------------------------------------------------------------- RpcChannel

template <typename S, typename E>
template <typename M, typename State, typename F>
requires UnaryMsg<M, S> std::error_code RpcChannel<S, E>::dispatch_unary(M request, State state,
                                                                         F handler) && {
  auto response = detail::invoke_handler(handler, std::move(state), std::move(request));
  static_assert(std::is_same_v<typename decltype(response)::value_type, ResponseOf<M>>,
                "unary handler must return the response type of its request");
  if (!response)
    return response.error();
  auto ec = send_.send(widen<typename S::Res>(std::move(*response)));
  send_.close();
  return ec;
}

template <typename S, typename E>
template <typename M, typename State, typename F>
requires ServerStreamingMsg<M, S> std::error_code
RpcChannel<S, E>::dispatch_server_streaming(M request, State state, F handler) && {
  auto source = detail::invoke_handler(handler, std::move(state), std::move(request));
  if (!source)
    return source.error();
  auto ec = detail::forward_items<ResponseOf<M>, typename S::Res>(*source, send_);
  send_.close();
  return ec;
}

template <typename S, typename E>
template <typename M, typename State, typename F>
requires ClientStreamingMsg<M, S> std::error_code
RpcChannel<S, E>::dispatch_client_streaming(M request, State state, F handler) && {
  UpdateStream<UpdateOf<M>, E> updates{std::move(recv_)};
  auto response =
      detail::invoke_handler(handler, std::move(state), std::move(request), std::move(updates));
  static_assert(std::is_same_v<typename decltype(response)::value_type, ResponseOf<M>>,
                "client-streaming handler must return the response type of its request");
  if (!response)
    return response.error();
  auto ec = send_.send(widen<typename S::Res>(std::move(*response)));
  send_.close();
  return ec;
}

template <typename S, typename E>
template <typename M, typename State, typename F>
requires BidiStreamingMsg<M, S> std::error_code
RpcChannel<S, E>::dispatch_bidi_streaming(M request, State state, F handler) && {
  UpdateStream<UpdateOf<M>, E> updates{std::move(recv_)};
  auto source =
      detail::invoke_handler(handler, std::move(state), std::move(request), std::move(updates));
  if (!source)
    return source.error();
  auto ec = detail::forward_items<ResponseOf<M>, typename S::Res>(*source, send_);
  send_.close();
  return ec;
}

// ---------------------------------------------------------------------------------- RpcServer

template <typename S, typename E>
tl::expected<typename RpcServer<S, E>::Accepted, std::error_code> RpcServer<S, E>::accept() const {
  auto socket = source_.accept();
  if (!socket)
    return tl::make_unexpected(socket.error());

  auto& [send, recv] = *socket;
  auto first = recv.next();
  if (!first) {
    TRACE("channel closed before its request arrived");
    return tl::make_unexpected(make_error_code(ecode::connection_closed));
  }
  if (!*first)
    return tl::make_unexpected(first->error());

  return Accepted{std::move(**first), RpcChannel<S, E>{std::move(send), std::move(recv)}};
}

} // namespace weft::rpc
