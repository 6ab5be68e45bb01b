
#pragma once

#include "weft/portable/asio/asio-execution-context.hpp"
#include "weft/rpc.hpp"
#include "weft/utils/serialize.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <variant>

namespace weft::rpc::tests {

// ------------------------------------------------------------------------------------- wait_until

template <typename Predicate> bool wait_until(Predicate predicate) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
  while (!predicate()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
  }
  return true;
}

// ------------------------------------------------------------------------------------- Transports

struct MemTransport {
  template <typename Req, typename Res>
  static auto connection(std::size_t capacity = mem::k_default_capacity) {
    return mem::connection<Req, Res>(capacity);
  }
};

struct WireTransport {
  template <typename Req, typename Res>
  static auto connection(std::size_t capacity = mem::k_default_capacity) {
    return wire::connection<Req, Res>(capacity);
  }
};

/**
 * Run an accept loop for `S` on `pool`, until every connection to `endpoint` is gone.
 */
template <typename S, typename E, typename H>
void serve(AsioExecutionContext& pool, E endpoint, H handler) {
  pool.post([server = RpcServer<S, E>{std::move(endpoint)}, handler]() {
    run_accept_loop(server, handler);
  });
}

// ------------------------------------------------------------------------------ CountingConnection

struct Counters {
  std::atomic<int> opened{0};
  std::atomic<int> sent{0};
  std::atomic<int> received{0};
};

template <typename T, typename Sink> class CountingSink {
private:
  Sink inner_;
  std::shared_ptr<Counters> counters_;

public:
  CountingSink(Sink inner, std::shared_ptr<Counters> counters)
      : inner_{std::move(inner)}, counters_{std::move(counters)} {}

  std::error_code send(T value) {
    ++counters_->sent;
    return inner_.send(std::move(value));
  }

  void close() { inner_.close(); }
};

template <typename T, typename Stream> class CountingStream {
private:
  Stream inner_;
  std::shared_ptr<Counters> counters_;

public:
  CountingStream(Stream inner, std::shared_ptr<Counters> counters)
      : inner_{std::move(inner)}, counters_{std::move(counters)} {}

  Received<T> next() {
    auto item = inner_.next();
    if (item)
      ++counters_->received;
    return item;
  }
};

/**
 * Counts the channels opened (or accepted), and the messages that cross them.
 */
template <typename C> class CountingConnection {
public:
  using In = typename C::In;
  using Out = typename C::Out;
  using SendSink = CountingSink<Out, typename C::SendSink>;
  using RecvStream = CountingStream<In, typename C::RecvStream>;
  using Socket = std::pair<SendSink, RecvStream>;

private:
  C inner_;
  std::shared_ptr<Counters> counters_;

  Socket wrap_(SocketOf<C>&& socket) const {
    ++counters_->opened;
    return Socket{SendSink{std::move(socket.first), counters_},
                  RecvStream{std::move(socket.second), counters_}};
  }

public:
  CountingConnection(C inner, std::shared_ptr<Counters> counters)
      : inner_{std::move(inner)}, counters_{std::move(counters)} {}

  tl::expected<Socket, std::error_code> open() const requires Connection<C> {
    auto socket = inner_.open();
    if (!socket)
      return tl::make_unexpected(socket.error());
    return wrap_(std::move(*socket));
  }

  tl::expected<Socket, std::error_code> accept() const requires Endpoint<C> {
    auto socket = inner_.accept();
    if (!socket)
      return tl::make_unexpected(socket.error());
    return wrap_(std::move(*socket));
  }
};

// ---------------------------------------------------------------------------------- ProbeService

struct ProbeService;

struct ProbeResponse {
  uint64_t value{0};
};

/** @brief An endless stream of 0, 1, 2, ... */
struct CountRequest {
  using Service = ProbeService;
  using Pattern = ServerStreaming;
  using Response = ProbeResponse;
};

enum class FaultKind : uint8_t { THROWS, RETURNS_ERROR, NONE };

/** @brief A handler that fails as asked */
struct FaultRequest {
  using Service = ProbeService;
  using Pattern = Unary;
  using Response = ProbeResponse;

  FaultKind kind{FaultKind::NONE};
};

struct ProbeService {
  using Req = std::variant<CountRequest, FaultRequest>;
  using Res = std::variant<ProbeResponse>;
};

inline error_code write(std::ostream&, const CountRequest&) { return {}; }
inline error_code read(std::istream&, CountRequest&) { return {}; }
inline error_code write(std::ostream& out, const FaultRequest& x) {
  return weft::write_u8(out, uint8_t(x.kind));
}
inline error_code read(std::istream& in, FaultRequest& x) {
  uint8_t kind = 0;
  auto ec = weft::read_u8(in, kind);
  x.kind = FaultKind(kind);
  return ec;
}
inline error_code write(std::ostream& out, const ProbeResponse& x) {
  return weft::write_u64(out, x.value);
}
inline error_code read(std::istream& in, ProbeResponse& x) { return weft::read_u64(in, x.value); }

struct Probe {
  std::atomic<uint64_t> produced{0};
  std::atomic<int> streams_finished{0};
};

class CountSource {
private:
  std::shared_ptr<Probe> probe_;
  uint64_t next_{0};

public:
  explicit CountSource(std::shared_ptr<Probe> probe) : probe_{std::move(probe)} {}

  std::optional<ProbeResponse> next() {
    ++probe_->produced;
    return ProbeResponse{next_++};
  }
};

class ProbeHandler {
private:
  std::shared_ptr<Probe> probe_ = std::make_shared<Probe>();

public:
  const Probe& probe() const { return *probe_; }

  CountSource count(CountRequest) const { return CountSource{probe_}; }

  tl::expected<ProbeResponse, error_code> fault(FaultRequest request) const {
    switch (request.kind) {
    case FaultKind::THROWS: throw std::runtime_error("handler exploded");
    case FaultKind::RETURNS_ERROR:
      return tl::make_unexpected(make_error_code(ecode::argument_error));
    case FaultKind::NONE: break;
    }
    return ProbeResponse{7};
  }

  template <typename E>
  error_code handle_rpc_request(ProbeService::Req request,
                                RpcChannel<ProbeService, E> channel) const {
    if (auto* count = std::get_if<CountRequest>(&request)) {
      auto ec = std::move(channel).dispatch_server_streaming(*count, *this, &ProbeHandler::count);
      ++probe_->streams_finished;
      return ec;
    }
    return std::move(channel).dispatch_unary(std::get<FaultRequest>(request), *this,
                                             &ProbeHandler::fault);
  }
};

} // namespace weft::rpc::tests
