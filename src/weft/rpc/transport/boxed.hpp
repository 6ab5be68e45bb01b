
#pragma once

#include "weft/rpc/connection.hpp"
#include "weft/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace weft::rpc {

template <typename T> class BoxedSendSink;
template <typename T> class BoxedRecvStream;

namespace detail {
  template <typename T> struct SinkInterface {
    virtual ~SinkInterface() = default;
    virtual std::error_code send(T value) = 0;
    virtual void close() = 0;
  };

  template <typename T, typename K> struct SinkModel final : public SinkInterface<T> {
    K sink;
    explicit SinkModel(K k) : sink{std::move(k)} {}
    std::error_code send(T value) override { return sink.send(std::move(value)); }
    void close() override { sink.close(); }
  };

  template <typename T> struct StreamInterface {
    virtual ~StreamInterface() = default;
    virtual Received<T> next() = 0;
  };

  template <typename T, typename R> struct StreamModel final : public StreamInterface<T> {
    R stream;
    explicit StreamModel(R r) : stream{std::move(r)} {}
    Received<T> next() override { return stream.next(); }
  };
} // namespace detail

// -------------------------------------------------------------------------------- BoxedSendSink

/**
 * @ingroup rpc
 * @brief Type erased send sink.
 */
template <typename T> class BoxedSendSink {
private:
  std::unique_ptr<detail::SinkInterface<T>> impl_;

public:
  BoxedSendSink() = default;

  template <typename K>
  requires(!std::is_same_v<K, BoxedSendSink>) && SendSinkFor<K, T> explicit BoxedSendSink(K sink)
      : impl_{std::make_unique<detail::SinkModel<T, K>>(std::move(sink))} {}

  /** @brief A default constructed (or moved from) sink fails with `ecode::connection_closed` */
  std::error_code send(T value) {
    if (!impl_)
      return make_error_code(ecode::connection_closed);
    return impl_->send(std::move(value));
  }

  void close() {
    if (impl_)
      impl_->close();
  }
};

// ------------------------------------------------------------------------------ BoxedRecvStream

/**
 * @ingroup rpc
 * @brief Type erased receive stream.
 */
template <typename T> class BoxedRecvStream {
private:
  std::unique_ptr<detail::StreamInterface<T>> impl_;

public:
  BoxedRecvStream() = default;

  template <typename R>
  requires(!std::is_same_v<R, BoxedRecvStream>) && RecvStreamFor<R, T> explicit BoxedRecvStream(
      R stream)
      : impl_{std::make_unique<detail::StreamModel<T, R>>(std::move(stream))} {}

  Received<T> next() {
    if (!impl_)
      return std::nullopt;
    return impl_->next();
  }
};

namespace detail {
  template <typename In, typename Out> using BoxedSocket =
      std::pair<BoxedSendSink<Out>, BoxedRecvStream<In>>;

  template <typename In, typename Out> struct OpenInterface {
    virtual ~OpenInterface() = default;
    virtual tl::expected<BoxedSocket<In, Out>, std::error_code> open() const = 0;
  };

  template <typename In, typename Out, typename C>
  struct OpenModel final : public OpenInterface<In, Out> {
    C conn;
    explicit OpenModel(C c) : conn{std::move(c)} {}
    tl::expected<BoxedSocket<In, Out>, std::error_code> open() const override {
      auto socket = conn.open();
      if (!socket)
        return tl::make_unexpected(socket.error());
      return BoxedSocket<In, Out>{BoxedSendSink<Out>{std::move(socket->first)},
                                  BoxedRecvStream<In>{std::move(socket->second)}};
    }
  };

  template <typename In, typename Out> struct AcceptInterface {
    virtual ~AcceptInterface() = default;
    virtual tl::expected<BoxedSocket<In, Out>, std::error_code> accept() const = 0;
  };

  template <typename In, typename Out, typename E>
  struct AcceptModel final : public AcceptInterface<In, Out> {
    E endpoint;
    explicit AcceptModel(E e) : endpoint{std::move(e)} {}
    tl::expected<BoxedSocket<In, Out>, std::error_code> accept() const override {
      auto socket = endpoint.accept();
      if (!socket)
        return tl::make_unexpected(socket.error());
      return BoxedSocket<In, Out>{BoxedSendSink<Out>{std::move(socket->first)},
                                  BoxedRecvStream<In>{std::move(socket->second)}};
    }
  };
} // namespace detail

// ------------------------------------------------------------------------------ BoxedConnection

/**
 * @ingroup rpc
 * @brief A connection of any transport with the given message types. Copies share the
 *        underlying connection.
 */
template <typename InT, typename OutT> class BoxedConnection {
public:
  using In = InT;
  using Out = OutT;
  using SendSink = BoxedSendSink<Out>;
  using RecvStream = BoxedRecvStream<In>;
  using Socket = std::pair<SendSink, RecvStream>;

private:
  std::shared_ptr<const detail::OpenInterface<In, Out>> impl_;

public:
  explicit BoxedConnection(std::shared_ptr<const detail::OpenInterface<In, Out>> impl)
      : impl_{std::move(impl)} {}

  tl::expected<Socket, std::error_code> open() const { return impl_->open(); }
};

/**
 * @ingroup rpc
 * @brief An endpoint of any transport with the given message types.
 */
template <typename InT, typename OutT> class BoxedEndpoint {
public:
  using In = InT;
  using Out = OutT;
  using SendSink = BoxedSendSink<Out>;
  using RecvStream = BoxedRecvStream<In>;
  using Socket = std::pair<SendSink, RecvStream>;

private:
  std::shared_ptr<const detail::AcceptInterface<In, Out>> impl_;

public:
  explicit BoxedEndpoint(std::shared_ptr<const detail::AcceptInterface<In, Out>> impl)
      : impl_{std::move(impl)} {}

  tl::expected<Socket, std::error_code> accept() const { return impl_->accept(); }
};

/** @ingroup rpc @brief Erase the transport type of `conn` */
template <typename C> BoxedConnection<typename C::In, typename C::Out> box_connection(C conn) {
  static_assert(Connection<C>);
  using In = typename C::In;
  using Out = typename C::Out;
  if constexpr (std::is_same_v<C, BoxedConnection<In, Out>>) {
    return conn;
  } else {
    return BoxedConnection<In, Out>{
        std::make_shared<const detail::OpenModel<In, Out, C>>(std::move(conn))};
  }
}

/** @ingroup rpc @brief Erase the transport type of `endpoint` */
template <typename E> BoxedEndpoint<typename E::In, typename E::Out> box_endpoint(E endpoint) {
  static_assert(Endpoint<E>);
  using In = typename E::In;
  using Out = typename E::Out;
  if constexpr (std::is_same_v<E, BoxedEndpoint<In, Out>>) {
    return endpoint;
  } else {
    return BoxedEndpoint<In, Out>{
        std::make_shared<const detail::AcceptModel<In, Out, E>>(std::move(endpoint))};
  }
}

/** @ingroup rpc @brief A boxed connection for clients of `S` */
template <typename S> using BoxedServiceConnection =
    BoxedConnection<typename S::Res, typename S::Req>;

/** @ingroup rpc @brief A boxed endpoint for servers of `S` */
template <typename S> using BoxedServiceEndpoint = BoxedEndpoint<typename S::Req, typename S::Res>;

} // namespace weft::rpc
