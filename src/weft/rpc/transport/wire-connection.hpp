
#pragma once

#include "mem-connection.hpp"

#include "weft/rpc/connection.hpp"
#include "weft/rpc/wire-codec.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <utility>

/**
 * Byte transport. Every message is encoded to a frame before it leaves the sender and decoded
 * on arrival, exactly as it would be for a network socket; the frames themselves travel
 * in-process. Message types need `write(std::ostream&, const T&)` and
 * `read(std::istream&, T&)` overloads, and a default constructor.
 */
namespace weft::rpc::wire {

// ------------------------------------------------------------------------------------ FrameSink

template <typename T> class FrameSink {
private:
  mem::PipeSink<FrameType> frames_;

public:
  FrameSink() = default;
  explicit FrameSink(mem::PipeSink<FrameType> frames) : frames_{std::move(frames)} {}

  /** @brief Fails with `ecode::serialization_error` when `value` can't be encoded */
  std::error_code send(T value) {
    auto frame = encode_frame(value);
    if (!frame)
      return frame.error();
    return frames_.send(std::move(*frame));
  }

  void close() { frames_.close(); }
};

// ---------------------------------------------------------------------------------- FrameStream

template <typename T> class FrameStream {
private:
  mem::PipeStream<FrameType> frames_;

public:
  FrameStream() = default;
  explicit FrameStream(mem::PipeStream<FrameType> frames) : frames_{std::move(frames)} {}

  /** @brief A frame that does not decode yields `ecode::serialization_error` */
  Received<T> next() {
    auto frame = frames_.next();
    if (!frame)
      return std::nullopt;
    if (!*frame)
      return Received<T>{std::in_place, tl::make_unexpected(frame->error())};
    return Received<T>{std::in_place, decode_frame<T>(**frame)};
  }

  void close() { frames_.close(); }
};

// ------------------------------------------------------------------------------------ Connection

template <typename InT, typename OutT> class Connection {
public:
  using In = InT;
  using Out = OutT;
  using SendSink = FrameSink<Out>;
  using RecvStream = FrameStream<In>;
  using Socket = std::pair<SendSink, RecvStream>;

private:
  mem::Connection<FrameType, FrameType> frames_;

public:
  explicit Connection(mem::Connection<FrameType, FrameType> frames) : frames_{std::move(frames)} {}

  tl::expected<Socket, std::error_code> open() const {
    auto socket = frames_.open();
    if (!socket)
      return tl::make_unexpected(socket.error());
    return Socket{SendSink{std::move(socket->first)}, RecvStream{std::move(socket->second)}};
  }
};

// -------------------------------------------------------------------------------------- Endpoint

template <typename InT, typename OutT> class Endpoint {
public:
  using In = InT;
  using Out = OutT;
  using SendSink = FrameSink<Out>;
  using RecvStream = FrameStream<In>;
  using Socket = std::pair<SendSink, RecvStream>;

private:
  mem::Endpoint<FrameType, FrameType> frames_;

public:
  explicit Endpoint(mem::Endpoint<FrameType, FrameType> frames) : frames_{std::move(frames)} {}

  tl::expected<Socket, std::error_code> accept() const {
    auto socket = frames_.accept();
    if (!socket)
      return tl::make_unexpected(socket.error());
    return Socket{SendSink{std::move(socket->first)}, RecvStream{std::move(socket->second)}};
  }
};

/**
 * @brief Create a connected endpoint and connection pair that encode every message.
 */
template <typename Req, typename Res>
std::pair<Endpoint<Req, Res>, Connection<Res, Req>> connection(std::size_t capacity
                                                              = mem::k_default_capacity) {
  auto [endpoint, conn] = mem::connection<FrameType, FrameType>(capacity);
  return {Endpoint<Req, Res>{std::move(endpoint)}, Connection<Res, Req>{std::move(conn)}};
}

} // namespace weft::rpc::wire
