
#pragma once

#include "weft/async/pipe.hpp"
#include "weft/rpc/connection.hpp"
#include "weft/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <memory>
#include <utility>

/**
 * In-process transport. Messages move between threads as values, through bounded pipes, and
 * are never encoded.
 */
namespace weft::rpc::mem {

/** @brief Default number of messages a channel direction buffers before `send` blocks */
constexpr std::size_t k_default_capacity = 32;

// -------------------------------------------------------------------------------------- PipeSink

template <typename T> class PipeSink {
private:
  async::PipeSender<T> tx_;

public:
  PipeSink() = default;
  explicit PipeSink(async::PipeSender<T> tx) : tx_{std::move(tx)} {}
  PipeSink(const PipeSink&) = delete;
  PipeSink(PipeSink&&) noexcept = default;
  PipeSink& operator=(const PipeSink&) = delete;
  PipeSink& operator=(PipeSink&&) noexcept = default;

  std::error_code send(T value) {
    if (!tx_.send(std::move(value)))
      return make_error_code(ecode::transport_error);
    return {};
  }

  void close() { tx_.close(); }
};

// ------------------------------------------------------------------------------------ PipeStream

template <typename T> class PipeStream {
private:
  async::PipeReceiver<T> rx_;

public:
  PipeStream() = default;
  explicit PipeStream(async::PipeReceiver<T> rx) : rx_{std::move(rx)} {}

  Received<T> next() {
    auto value = rx_.recv();
    if (!value)
      return std::nullopt;
    return Received<T>{std::in_place, std::move(*value)};
  }

  void close() { rx_.close(); }
};

// ------------------------------------------------------------------------------------ Connection

/**
 * @brief Client handle of an in-process transport. Copies share the endpoint.
 */
template <typename InT, typename OutT> class Connection {
public:
  using In = InT;
  using Out = OutT;
  using SendSink = PipeSink<Out>;
  using RecvStream = PipeStream<In>;
  using Socket = std::pair<SendSink, RecvStream>;
  using PeerSocket = std::pair<PipeSink<In>, PipeStream<Out>>;

private:
  async::PipeSender<PeerSocket> accept_tx_;
  std::size_t capacity_;

public:
  Connection(async::PipeSender<PeerSocket> accept_tx, std::size_t capacity)
      : accept_tx_{std::move(accept_tx)}, capacity_{capacity} {}

  /**
   * @brief Open a fresh channel; the other half is queued for the endpoint to accept.
   * Fails with `ecode::connection_closed` when the endpoint is gone.
   */
  tl::expected<Socket, std::error_code> open() const {
    auto [out_tx, out_rx] = async::make_pipe<Out>(capacity_);
    auto [in_tx, in_rx] = async::make_pipe<In>(capacity_);
    PeerSocket peer{PipeSink<In>{std::move(in_tx)}, PipeStream<Out>{std::move(out_rx)}};
    if (!accept_tx_.send(std::move(peer)))
      return tl::make_unexpected(make_error_code(ecode::connection_closed));
    return Socket{SendSink{std::move(out_tx)}, RecvStream{std::move(in_rx)}};
  }
};

// -------------------------------------------------------------------------------------- Endpoint

/**
 * @brief Server handle of an in-process transport. Copies share one accept queue, so each
 *        channel is accepted exactly once.
 */
template <typename InT, typename OutT> class Endpoint {
public:
  using In = InT;
  using Out = OutT;
  using SendSink = PipeSink<Out>;
  using RecvStream = PipeStream<In>;
  using Socket = std::pair<SendSink, RecvStream>;

private:
  std::shared_ptr<async::PipeReceiver<Socket>> accept_rx_;

public:
  explicit Endpoint(async::PipeReceiver<Socket> accept_rx)
      : accept_rx_{std::make_shared<async::PipeReceiver<Socket>>(std::move(accept_rx))} {}

  /** @brief Blocks until a client opens a channel */
  tl::expected<Socket, std::error_code> accept() const {
    auto socket = accept_rx_->recv();
    if (!socket)
      return tl::make_unexpected(make_error_code(ecode::endpoint_closed));
    return std::move(*socket);
  }
};

/**
 * @brief Create a connected in-process endpoint and connection pair.
 * @param capacity Messages buffered per direction of each channel, and channels awaiting accept.
 */
template <typename Req, typename Res>
std::pair<Endpoint<Req, Res>, Connection<Res, Req>> connection(std::size_t capacity
                                                              = k_default_capacity) {
  auto [accept_tx, accept_rx] = async::make_pipe<typename Endpoint<Req, Res>::Socket>(capacity);
  return {Endpoint<Req, Res>{std::move(accept_rx)},
          Connection<Res, Req>{std::move(accept_tx), capacity}};
}

} // namespace weft::rpc::mem
