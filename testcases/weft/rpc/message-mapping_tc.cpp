
#include "stdinc.hpp"

#include "weft/demo/app-service.hpp"
#include "weft/rpc/message-mapping.hpp"
#include "weft/rpc/message.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <variant>

namespace weft::rpc::tests {

namespace calc = demo::calc;
namespace clock = demo::clock;
namespace inner = demo::inner;
namespace app = demo::app;

// ------------------------------------------------------------------------- compile time checks

namespace {
  struct Ambiguous {
    using Req = std::variant<int, std::string, int>;
    using Res = std::variant<int>;
  };

  struct Stranger {
    using Service = calc::Service;
    using Pattern = Unary;
    using Response = calc::AddResponse;
  };
} // namespace

static_assert(Service<calc::Service>);
static_assert(Service<app::Service>);
static_assert(!Service<Ambiguous>);

static_assert(UnaryMsg<calc::AddRequest, calc::Service>);
static_assert(!UnaryMsg<calc::FibonacciRequest, calc::Service>);
static_assert(ServerStreamingMsg<calc::FibonacciRequest, calc::Service>);
static_assert(ClientStreamingMsg<calc::SumRequest, calc::Service>);
static_assert(BidiStreamingMsg<calc::MultiplyRequest, calc::Service>);
static_assert(ServerStreamingMsg<clock::TickRequest, clock::Service>);

// A request can only be sent to the service it names, and only if that service carries it
static_assert(!UnaryMsg<calc::AddRequest, app::Service>);
static_assert(!UnaryMsg<Stranger, calc::Service>);

static_assert(ServiceMappable<app::Service, inner::Service>);
static_assert(ServiceMappable<inner::Service, calc::Service>);
static_assert(ServiceMappable<calc::Service, calc::Service>);
static_assert(!ServiceMappable<calc::Service, clock::Service>);
static_assert(!ServiceMappable<app::Service, calc::Service>); // calc is two levels down

static_assert(Mappable<std::variant<int, std::string>, std::string>);
static_assert(!Mappable<std::variant<int, std::string>, double>);

// ----------------------------------------------------------------------------------- testcases

CATCH_TEST_CASE("MessageMapping", "[message-mapping]") {
  CATCH_SECTION("identity") {
    const auto value = widen<calc::AddRequest>(calc::AddRequest{1, 2});
    CATCH_REQUIRE(value == calc::AddRequest{1, 2});
    CATCH_REQUIRE(narrow<calc::AddRequest>(value) == calc::AddRequest{1, 2});
  }

  CATCH_SECTION("narrow gives back what widen put in") {
    const auto request = widen<calc::Service::Req>(calc::AddRequest{40, 2});
    CATCH_REQUIRE(std::holds_alternative<calc::AddRequest>(request));

    const auto back = narrow<calc::AddRequest>(request);
    CATCH_REQUIRE(back.has_value());
    CATCH_REQUIRE(*back == calc::AddRequest{40, 2});

    const auto update = narrow<calc::SumUpdate>(widen<calc::Service::Req>(calc::SumUpdate{5}));
    CATCH_REQUIRE(update == calc::SumUpdate{5});
  }

  CATCH_SECTION("narrowing a different alternative fails") {
    const auto request = widen<calc::Service::Req>(calc::SumRequest{});
    CATCH_REQUIRE(!narrow<calc::AddRequest>(request).has_value());
    CATCH_REQUIRE(!narrow<calc::SumUpdate>(request).has_value());

    const auto response = widen<calc::Service::Res>(calc::FibonacciResponse{8});
    CATCH_REQUIRE(!narrow<calc::AddResponse>(response).has_value());
    CATCH_REQUIRE(narrow<calc::FibonacciResponse>(response) == calc::FibonacciResponse{8});
  }

  CATCH_SECTION("nested services") {
    // calc -> inner -> app, one level at a time
    auto calc_req = widen<calc::Service::Req>(calc::AddRequest{3, 4});
    auto inner_req = widen<inner::Service::Req>(calc_req);
    const auto app_req = widen<app::Service::Req>(inner_req);

    auto inner_back = narrow<inner::Service::Req>(app_req);
    CATCH_REQUIRE(inner_back.has_value());
    auto calc_back = narrow<calc::Service::Req>(*inner_back);
    CATCH_REQUIRE(calc_back.has_value());
    CATCH_REQUIRE(narrow<calc::AddRequest>(*calc_back) == calc::AddRequest{3, 4});

    // A clock request narrows out of inner, but not into calc
    const auto tick_req
        = widen<inner::Service::Req>(widen<clock::Service::Req>(clock::TickRequest{}));
    CATCH_REQUIRE(!narrow<calc::Service::Req>(tick_req).has_value());
    CATCH_REQUIRE(narrow<clock::Service::Req>(tick_req).has_value());

    // And the app's own messages don't narrow into inner
    const auto version_req = widen<app::Service::Req>(app::AppVersionRequest{});
    CATCH_REQUIRE(!narrow<inner::Service::Req>(version_req).has_value());
  }
}

} // namespace weft::rpc::tests
