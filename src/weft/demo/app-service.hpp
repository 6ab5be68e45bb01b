
#pragma once

#include "inner-service.hpp"

#include "weft/rpc/client.hpp"
#include "weft/rpc/message.hpp"
#include "weft/rpc/server.hpp"
#include "weft/utils/error-codes.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <tl/expected.hpp>

#include <chrono>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

/**
 * The top-level service: everything `inner` offers, plus the app's version.
 */
namespace weft::demo::app {

struct Service;

struct AppVersionResponse {
  std::string version;
  bool operator==(const AppVersionResponse&) const = default;
};

struct AppVersionRequest {
  using Service = app::Service;
  using Pattern = rpc::Unary;
  using Response = AppVersionResponse;

  bool operator==(const AppVersionRequest&) const = default;
};

struct Service {
  using Req = std::variant<inner::Service::Req, AppVersionRequest>;
  using Res = std::variant<inner::Service::Res, AppVersionResponse>;
};

error_code write(std::ostream& out, const AppVersionRequest& x);
error_code write(std::ostream& out, const AppVersionResponse& x);
error_code read(std::istream& in, AppVersionRequest& x);
error_code read(std::istream& in, AppVersionResponse& x);

class Handler {
private:
  inner::Handler inner_;
  std::shared_ptr<const std::string> version_;

public:
  Handler(std::string version, boost::asio::any_io_executor executor,
          std::chrono::milliseconds tick_period);

  const inner::Handler& inner() const { return inner_; }

  AppVersionResponse version(AppVersionRequest request) const;

  /** @brief End live subscriptions; see `clock::Handler::stop` */
  void stop() const { inner_.stop(); }

  template <typename E>
  error_code handle_rpc_request(Service::Req request, rpc::RpcChannel<Service, E> channel) const {
    return std::visit(
        [this, &channel](auto&& msg) -> error_code {
          using T = std::decay_t<decltype(msg)>;
          if constexpr (std::is_same_v<T, AppVersionRequest>) {
            return std::move(channel).dispatch_unary(std::move(msg), *this, &Handler::version);
          } else {
            static_assert(std::is_same_v<T, inner::Service::Req>);
            return inner_.handle_rpc_request(std::move(msg),
                                             std::move(channel).template map<inner::Service>());
          }
        },
        std::move(request));
  }
};

/**
 * @brief Typed app client.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * app::Client client{rpc::RpcClient<app::Service, decltype(conn)>{conn}};
 * auto sum = client.inner().calc().add(40, 2);
 * ~~~~~~~~~~~~~~~~~~~~~~
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

  tl::expected<std::string, error_code> version() const {
    auto response = rpc_.unary_call(AppVersionRequest{});
    if (!response)
      return tl::make_unexpected(response.error());
    return std::move(response->version);
  }

  auto inner() const { return inner::Client{rpc_}; }
};

} // namespace weft::demo::app
