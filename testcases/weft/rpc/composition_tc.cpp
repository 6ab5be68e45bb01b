
#include "stdinc.hpp"

#include "test-utils.hpp"

#include "weft/demo/app-service.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace weft::rpc::tests {

namespace app = demo::app;
namespace calc = demo::calc;

namespace {
  constexpr std::string_view k_version = "weft-test 1.2.3";

  /**
   * The updates of a streaming call, already received.
   */
  template <typename T> class ListedUpdates {
  private:
    std::vector<T> updates_;
    std::size_t position_{0};

  public:
    explicit ListedUpdates(std::vector<T> updates) : updates_{std::move(updates)} {}

    Received<T> next() {
      if (position_ == updates_.size())
        return std::nullopt;
      return Received<T>{std::in_place, updates_[position_++]};
    }
  };

  /**
   * The app service, served on its own pool over `Transport`.
   */
  template <typename Transport> class AppFixture {
  private:
    using Pair
        = decltype(Transport::template connection<app::Service::Req, app::Service::Res>());

  public:
    using RpcClientType = RpcClient<app::Service, typename Pair::second_type>;

    AsioExecutionContext pool;
    app::Handler handler;
    std::optional<RpcClientType> rpc;

    explicit AppFixture(std::size_t thread_count = 8)
        : pool{thread_count},
          handler{std::string{k_version}, pool.get_executor(), std::chrono::milliseconds{5}} {
      pool.run();
      auto [endpoint, conn] = Transport::template connection<app::Service::Req,
                                                             app::Service::Res>();
      serve<app::Service>(pool, std::move(endpoint), handler);
      rpc.emplace(std::move(conn));
    }

    ~AppFixture() {
      rpc.reset(); // ends the accept loop
      handler.stop();
    }
  };
} // namespace

// ------------------------------------------------------------------------------- composition

CATCH_TEMPLATE_TEST_CASE("ServiceComposition", "[rpc][demo]", MemTransport, WireTransport) {
  AppFixture<TestType> fixture;
  const app::Client client{*fixture.rpc};

  CATCH_SECTION("the app answers its own calls") {
    auto version = client.version();
    CATCH_REQUIRE(version.has_value());
    CATCH_REQUIRE(*version == k_version);
  }

  CATCH_SECTION("a call routed through app and inner matches a direct call") {
    const auto calc_client = client.inner().calc();
    auto routed = calc_client.add(40, 2);
    CATCH_REQUIRE(routed.has_value());
    CATCH_REQUIRE(*routed == 42);
    CATCH_REQUIRE(*routed == fixture.handler.inner().calc().add(calc::AddRequest{40, 2})->value);
  }

  CATCH_SECTION("an overflowing add fails only its own call") {
    const auto calc_client = client.inner().calc();
    auto overflow = calc_client.add(std::numeric_limits<int64_t>::max(), 1);
    CATCH_REQUIRE(!overflow.has_value());
    CATCH_REQUIRE(overflow.error() == ecode::connection_closed);

    auto sum = calc_client.add(-1, 1);
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(*sum == 0);
  }

  CATCH_SECTION("every pattern works through two levels of nesting") {
    const auto calc_client = client.inner().calc();

    auto sum = calc_client.sum({1, 2, 3, 4});
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(*sum == 10);

    auto values = calc_client.fibonacci(6);
    CATCH_REQUIRE(values.has_value());
    CATCH_REQUIRE(*values == std::vector<uint64_t>{0, 1, 1, 2, 3, 5});

    auto call = calc_client.multiply(-2);
    CATCH_REQUIRE(call.has_value());
    CATCH_REQUIRE(!call->updates.send(calc::MultiplyUpdate{21}));
    auto product = call->responses.next();
    CATCH_REQUIRE(product.has_value());
    CATCH_REQUIRE(product->has_value());
    CATCH_REQUIRE((*product)->value == -42);
  }

  CATCH_SECTION("a tick subscription starts at the current tick, and never goes back") {
    const auto& ticker = fixture.handler.inner().clock();
    CATCH_REQUIRE(wait_until([&ticker]() { return ticker.current_tick() >= 3; }));

    auto stream = client.inner().clock().tick();
    CATCH_REQUIRE(stream.has_value());

    uint64_t last = 0;
    for (int i = 0; i < 4; ++i) {
      auto item = stream->next();
      CATCH_REQUIRE(item.has_value());
      CATCH_REQUIRE(item->has_value());
      if (i == 0)
        CATCH_REQUIRE((*item)->tick >= 3);
      CATCH_REQUIRE((*item)->tick >= last);
      last = (*item)->tick;
    }
  }

  CATCH_SECTION("stopping the clock ends live subscriptions") {
    auto stream = client.inner().clock().tick();
    CATCH_REQUIRE(stream.has_value());
    CATCH_REQUIRE(stream->next().has_value());

    fixture.handler.stop();

    // Ticks already in flight may still arrive
    int remaining = 0;
    while (stream->next().has_value())
      ++remaining;
    CATCH_REQUIRE(remaining <= int(mem::k_default_capacity) + 1);

    // ...and the rest of the app is still served
    auto version = client.version();
    CATCH_REQUIRE(version.has_value());
    CATCH_REQUIRE(*version == k_version);

    auto late = client.inner().clock().tick();
    CATCH_REQUIRE(late.has_value());
    CATCH_REQUIRE(!late->next().has_value());
  }

  CATCH_SECTION("a boxed client reaches the same services") {
    const RpcClient<app::Service> boxed = fixture.rpc->boxed();
    const app::Client boxed_client{boxed};

    auto version = boxed_client.version();
    CATCH_REQUIRE(version.has_value());
    CATCH_REQUIRE(*version == k_version);

    auto sum = boxed_client.inner().calc().add(1, 2);
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(*sum == 3);
  }
}

// ------------------------------------------------------------------------- live subscriptions

CATCH_TEMPLATE_TEST_CASE("LiveSubscriptions", "[rpc][demo]", MemTransport, WireTransport) {
  // The smallest pool the demo runs with: one thread for the accept loop, one for the timer
  AppFixture<TestType> fixture{2};
  const app::Client client{*fixture.rpc};
  const auto& ticker = fixture.handler.inner().clock();

  auto first = client.inner().clock().tick();
  auto second = client.inner().clock().tick();
  auto third = client.inner().clock().tick();
  CATCH_REQUIRE(first.has_value());
  CATCH_REQUIRE(second.has_value());
  CATCH_REQUIRE(third.has_value());
  CATCH_REQUIRE(first->next().has_value());
  CATCH_REQUIRE(second->next().has_value());
  CATCH_REQUIRE(third->next().has_value());

  CATCH_SECTION("the clock keeps ticking") {
    const auto start = ticker.current_tick();
    CATCH_REQUIRE(wait_until([&ticker, start]() { return ticker.current_tick() >= start + 3; }));

    auto item = first->next();
    CATCH_REQUIRE(item.has_value());
    CATCH_REQUIRE(item->has_value());
    CATCH_REQUIRE((*item)->tick >= start + 3);
  }

  CATCH_SECTION("other calls are still served") {
    auto version = client.version();
    CATCH_REQUIRE(version.has_value());
    CATCH_REQUIRE(*version == k_version);

    auto sum = client.inner().calc().add(2, 2);
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(*sum == 4);

    auto fourth = client.inner().clock().tick();
    CATCH_REQUIRE(fourth.has_value());
    CATCH_REQUIRE(fourth->next().has_value());
  }
}

// ---------------------------------------------------------------------------------- handlers

CATCH_TEST_CASE("DemoHandlers", "[demo]") {
  CATCH_SECTION("calc") {
    const calc::Handler handler;
    CATCH_REQUIRE(handler.add(calc::AddRequest{-3, 10})->value == 7);

    auto source = handler.fibonacci(calc::FibonacciRequest{3});
    CATCH_REQUIRE(source.next() == calc::FibonacciResponse{0});
    CATCH_REQUIRE(source.next() == calc::FibonacciResponse{1});
    CATCH_REQUIRE(source.next() == calc::FibonacciResponse{1});
    CATCH_REQUIRE(!source.next().has_value());
  }

  CATCH_SECTION("calc arithmetic that overflows is an argument error") {
    constexpr auto k_max = std::numeric_limits<int64_t>::max();
    constexpr auto k_min = std::numeric_limits<int64_t>::min();
    const calc::Handler handler;

    auto sum = handler.add(calc::AddRequest{k_max, 1});
    CATCH_REQUIRE(!sum.has_value());
    CATCH_REQUIRE(sum.error() == ecode::argument_error);
    CATCH_REQUIRE(handler.add(calc::AddRequest{k_min, -1}).error() == ecode::argument_error);
    CATCH_REQUIRE(handler.add(calc::AddRequest{k_max, k_min})->value == -1);

    const std::vector<calc::SumUpdate> addends{{k_max}, {1}};
    auto total = handler.sum(calc::SumRequest{}, ListedUpdates<calc::SumUpdate>{addends});
    CATCH_REQUIRE(!total.has_value());
    CATCH_REQUIRE(total.error() == ecode::argument_error);

    const std::vector<calc::MultiplyUpdate> factors{{3}, {k_max}};
    auto products
        = handler.multiply(calc::MultiplyRequest{2}, ListedUpdates<calc::MultiplyUpdate>{factors});
    auto product = products.next();
    CATCH_REQUIRE(product.has_value());
    CATCH_REQUIRE(product->has_value());
    CATCH_REQUIRE((*product)->value == 6);
    product = products.next();
    CATCH_REQUIRE(product.has_value());
    CATCH_REQUIRE(!product->has_value());
    CATCH_REQUIRE(product->error() == ecode::argument_error);
  }

  CATCH_SECTION("clock") {
    AsioExecutionContext pool{2};
    const demo::clock::Handler handler{pool.get_executor(), std::chrono::milliseconds{2}};
    pool.run();

    CATCH_REQUIRE(wait_until([&handler]() { return handler.current_tick() >= 2; }));

    auto source = handler.tick(demo::clock::TickRequest{});
    auto first = source.next();
    CATCH_REQUIRE(first.has_value());
    CATCH_REQUIRE(first->tick >= 2);

    auto second = source.next();
    CATCH_REQUIRE(second.has_value());
    CATCH_REQUIRE(second->tick >= first->tick);

    handler.stop();
    CATCH_REQUIRE(!source.next().has_value());

    // A tick that was already running may still land
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
    const auto stopped_at = handler.current_tick();
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
    CATCH_REQUIRE(handler.current_tick() == stopped_at);
  }
}

} // namespace weft::rpc::tests
