
#pragma once

#include "weft/async/notify.hpp"
#include "weft/async/periodic-task.hpp"
#include "weft/rpc/client.hpp"
#include "weft/rpc/message.hpp"
#include "weft/rpc/server.hpp"
#include "weft/utils/error-codes.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <type_traits>
#include <variant>

/**
 * Clock service: subscribers receive a tick counter that advances periodically.
 */
namespace weft::demo::clock {

struct Service;

// -------------------------------------------------------------------------------------- Messages

struct TickResponse {
  uint64_t tick{0};
  bool operator==(const TickResponse&) const = default;
};

/** @brief Subscribe to the tick counter */
struct TickRequest {
  using Service = clock::Service;
  using Pattern = rpc::ServerStreaming;
  using Response = TickResponse;

  bool operator==(const TickRequest&) const = default;
};

struct Service {
  using Req = std::variant<TickRequest>;
  using Res = std::variant<TickResponse>;
};

error_code write(std::ostream& out, const TickRequest& x);
error_code write(std::ostream& out, const TickResponse& x);
error_code read(std::istream& in, TickRequest& x);
error_code read(std::istream& in, TickResponse& x);

// ------------------------------------------------------------------------------------ TickSource

namespace detail {
  /**
   * @private
   * @brief The counter, and the signal that wakes subscribers after each increment.
   */
  struct TickState {
    mutable std::shared_mutex padlock;
    uint64_t counter{0};
    async::Notify notify;
  };
} // namespace detail

/**
 * @brief One subscription. Yields the current counter at once, then the counter after each
 *        wake. Wakes that arrive while the subscriber is busy merge into one, so values can be
 *        skipped but never go backwards. Ends when the clock stops.
 */
class TickSource {
private:
  std::shared_ptr<detail::TickState> state_;
  uint64_t seen_{0};
  bool is_started_{false};

public:
  explicit TickSource(std::shared_ptr<detail::TickState> state) : state_{std::move(state)} {}
  std::optional<TickResponse> next();
};

// --------------------------------------------------------------------------------------- Handler

/**
 * @brief Serves clock calls. Copies share one counter, and one periodic task that stops when
 *        the last copy is destroyed (or any copy calls `stop`).
 */
class Handler {
private:
  struct Ticker;

  std::shared_ptr<detail::TickState> state_;
  std::shared_ptr<Ticker> ticker_;

public:
  Handler(boost::asio::any_io_executor executor, std::chrono::milliseconds period);

  TickSource tick(TickRequest request) const;

  /** @brief The counter's current value */
  uint64_t current_tick() const;

  /** @brief Stop ticking, and end every live subscription */
  void stop() const;

  template <typename E>
  error_code handle_rpc_request(Service::Req request, rpc::RpcChannel<Service, E> channel) const {
    return std::visit(
        [this, &channel](TickRequest msg) -> error_code {
          return std::move(channel).dispatch_server_streaming(std::move(msg), *this,
                                                              &Handler::tick);
        },
        std::move(request));
  }
};

// ---------------------------------------------------------------------------------------- Client

/**
 * @brief Typed clock client, built from a client of any service that embeds clock.
 */
template <typename SOuter, typename C> class Client {
public:
  using RpcClientType =
      rpc::RpcClient<Service, rpc::MappedConnection<Service::Res, Service::Req, C>>;

private:
  RpcClientType rpc_;

public:
  explicit Client(const rpc::RpcClient<SOuter, C>& outer)
      : rpc_{outer.template map<Service>()} {}

  const RpcClientType& rpc() const { return rpc_; }

  /** @brief Subscribe to ticks; drop the stream to unsubscribe */
  auto tick() const { return rpc_.server_streaming_call(TickRequest{}); }
};

} // namespace weft::demo::clock
