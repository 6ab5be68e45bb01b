
#pragma once

#include "calc-service.hpp"
#include "clock-service.hpp"

#include "weft/rpc/client.hpp"
#include "weft/rpc/server.hpp"
#include "weft/utils/error-codes.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <type_traits>
#include <variant>

/**
 * Composition of calc and clock. Owns no calls of its own; every request belongs to exactly
 * one of the two, and is routed there.
 */
namespace weft::demo::inner {

struct Service {
  using Req = std::variant<calc::Service::Req, clock::Service::Req>;
  using Res = std::variant<calc::Service::Res, clock::Service::Res>;
};

class Handler {
private:
  calc::Handler calc_;
  clock::Handler clock_;

public:
  Handler(boost::asio::any_io_executor executor, std::chrono::milliseconds tick_period)
      : clock_{std::move(executor), tick_period} {}

  const calc::Handler& calc() const { return calc_; }
  const clock::Handler& clock() const { return clock_; }

  void stop() const { clock_.stop(); }

  template <typename E>
  error_code handle_rpc_request(Service::Req request, rpc::RpcChannel<Service, E> channel) const {
    return std::visit(
        [this, &channel](auto&& msg) -> error_code {
          using T = std::decay_t<decltype(msg)>;
          if constexpr (std::is_same_v<T, calc::Service::Req>) {
            return calc_.handle_rpc_request(std::move(msg),
                                            std::move(channel).template map<calc::Service>());
          } else {
            static_assert(std::is_same_v<T, clock::Service::Req>);
            return clock_.handle_rpc_request(std::move(msg),
                                             std::move(channel).template map<clock::Service>());
          }
        },
        std::move(request));
  }
};

/**
 * @brief Typed inner client, built from a client of any service that embeds inner.
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

  auto calc() const { return calc::Client{rpc_}; }
  auto clock() const { return clock::Client{rpc_}; }
};

} // namespace weft::demo::inner
