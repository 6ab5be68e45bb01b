
#include "stdinc.hpp"

#include "test-utils.hpp"

#include "weft/demo/calc-service.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

namespace weft::rpc::tests {

namespace calc = demo::calc;

// ---------------------------------------------------------------------------------- patterns

CATCH_TEMPLATE_TEST_CASE("RpcPatterns", "[rpc]", MemTransport, WireTransport) {
  using Pair = decltype(TestType::template connection<calc::Service::Req, calc::Service::Res>());
  using CalcEndpoint = CountingConnection<typename Pair::first_type>;
  using CalcConnection = CountingConnection<typename Pair::second_type>;

  AsioExecutionContext pool{8};
  pool.run();

  auto server_counters = std::make_shared<Counters>();
  auto client_counters = std::make_shared<Counters>();
  auto [endpoint, conn] = TestType::template connection<calc::Service::Req, calc::Service::Res>();
  serve<calc::Service>(pool, CalcEndpoint{std::move(endpoint), server_counters}, calc::Handler{});
  const RpcClient<calc::Service, CalcConnection> client{
      CalcConnection{std::move(conn), client_counters}};

  CATCH_SECTION("unary: one message each way, on one channel") {
    auto sum = client.unary_call(calc::AddRequest{40, 2});
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(*sum == calc::AddResponse{42});

    CATCH_REQUIRE(client_counters->opened.load() == 1);
    CATCH_REQUIRE(client_counters->sent.load() == 1);
    CATCH_REQUIRE(client_counters->received.load() == 1);
    CATCH_REQUIRE(server_counters->opened.load() == 1);
    CATCH_REQUIRE(server_counters->received.load() == 1);
    CATCH_REQUIRE(server_counters->sent.load() == 1);
  }

  CATCH_SECTION("server streaming: responses arrive in order, then the stream ends") {
    auto stream = client.server_streaming_call(calc::FibonacciRequest{10});
    CATCH_REQUIRE(stream.has_value());

    std::vector<uint64_t> values;
    for (auto item = stream->next(); item; item = stream->next()) {
      CATCH_REQUIRE(item->has_value());
      values.push_back((*item)->value);
    }
    CATCH_REQUIRE(values == std::vector<uint64_t>{0, 1, 1, 2, 3, 5, 8, 13, 21, 34});
    CATCH_REQUIRE(stream->is_done());
    CATCH_REQUIRE(!stream->next().has_value());
  }

  CATCH_SECTION("server streaming: an empty sequence") {
    auto stream = client.server_streaming_call(calc::FibonacciRequest{0});
    CATCH_REQUIRE(stream.has_value());
    CATCH_REQUIRE(!stream->next().has_value());
  }

  CATCH_SECTION("client streaming: many updates, one response") {
    auto call = client.client_streaming_call(calc::SumRequest{});
    CATCH_REQUIRE(call.has_value());
    for (int64_t x = 1; x <= 10; ++x)
      CATCH_REQUIRE(!call->send(calc::SumUpdate{x}));
    auto sum = std::move(*call).finish();
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(sum->value == 55);
  }

  CATCH_SECTION("client streaming: no updates") {
    auto call = client.client_streaming_call(calc::SumRequest{});
    CATCH_REQUIRE(call.has_value());
    auto sum = std::move(*call).finish();
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(sum->value == 0);
  }

  CATCH_SECTION("bidi streaming: each update answered as it arrives") {
    auto call = client.bidi_call(calc::MultiplyRequest{3});
    CATCH_REQUIRE(call.has_value());

    for (int64_t x : {1, 2, -7}) {
      CATCH_REQUIRE(!call->updates.send(calc::MultiplyUpdate{x}));
      auto item = call->responses.next();
      CATCH_REQUIRE(item.has_value());
      CATCH_REQUIRE(item->has_value());
      CATCH_REQUIRE((*item)->value == 3 * x);
    }

    call->updates.close();
    CATCH_REQUIRE(!call->responses.next().has_value());
  }

  CATCH_SECTION("bidi streaming: updates and responses on separate threads") {
    auto call = client.bidi_call(calc::MultiplyRequest{2});
    CATCH_REQUIRE(call.has_value());

    std::thread sender{[&updates = call->updates]() {
      for (int64_t x = 0; x < 100; ++x)
        if (updates.send(calc::MultiplyUpdate{x}))
          break;
      updates.close();
    }};

    std::vector<int64_t> products;
    for (auto item = call->responses.next(); item; item = call->responses.next())
      products.push_back(*item ? (*item)->value : -1);
    sender.join();

    CATCH_REQUIRE(products.size() == 100);
    for (std::size_t i = 0; i < products.size(); ++i)
      CATCH_REQUIRE(products[i] == int64_t(2 * i));
  }

  CATCH_SECTION("calls from many threads don't interfere") {
    constexpr int k_thread_count = 4;
    constexpr int k_calls = 25;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < k_thread_count; ++t) {
      threads.emplace_back([&client, &failures, t]() {
        for (int i = 0; i < k_calls; ++i) {
          auto sum = client.unary_call(calc::AddRequest{t * 1000, i});
          if (!sum || sum->value != t * 1000 + i)
            ++failures;
        }
      });
    }
    for (auto& thread : threads)
      thread.join();

    CATCH_REQUIRE(failures.load() == 0);
    CATCH_REQUIRE(client_counters->opened.load() == k_thread_count * k_calls);
  }

  CATCH_SECTION("an update can't start a call") {
    auto socket = client.connection().open();
    CATCH_REQUIRE(socket.has_value());
    CATCH_REQUIRE(!socket->first.send(calc::Service::Req{calc::SumUpdate{1}}));
    CATCH_REQUIRE(!socket->second.next().has_value());

    // The server carries on
    auto sum = client.unary_call(calc::AddRequest{1, 1});
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(sum->value == 2);
  }
}

// ------------------------------------------------------------------------------------ faults

CATCH_TEMPLATE_TEST_CASE("RpcFaults", "[rpc]", MemTransport, WireTransport) {
  using Pair = decltype(TestType::template connection<ProbeService::Req, ProbeService::Res>());
  using ProbeConnection = typename Pair::second_type;
  constexpr std::size_t k_capacity = 4;

  // The accept loop's thread; every call runs on a thread of its own
  AsioExecutionContext pool{1};
  pool.run();

  const ProbeHandler handler;
  auto [endpoint, conn]
      = TestType::template connection<ProbeService::Req, ProbeService::Res>(k_capacity);
  serve<ProbeService>(pool, std::move(endpoint), handler);
  const RpcClient<ProbeService, ProbeConnection> client{std::move(conn)};

  CATCH_SECTION("dropping a response stream stops the producer") {
    {
      auto stream = client.server_streaming_call(CountRequest{});
      CATCH_REQUIRE(stream.has_value());
      for (uint64_t i = 0; i < 5; ++i) {
        auto item = stream->next();
        CATCH_REQUIRE(item.has_value());
        CATCH_REQUIRE(item->has_value());
        CATCH_REQUIRE((*item)->value == i);
      }
    }

    CATCH_REQUIRE(wait_until([&handler]() { return handler.probe().streams_finished == 1; }));

    // Read, buffered, and the one whose send failed
    const auto produced = handler.probe().produced.load();
    CATCH_REQUIRE(produced <= 5 + k_capacity + 1);
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    CATCH_REQUIRE(handler.probe().produced.load() == produced);
  }

  CATCH_SECTION("a throwing handler fails only its own call") {
    auto failed = client.unary_call(FaultRequest{FaultKind::THROWS});
    CATCH_REQUIRE(!failed.has_value());
    CATCH_REQUIRE(failed.error() == ecode::connection_closed);

    auto response = client.unary_call(FaultRequest{FaultKind::NONE});
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->value == 7);
  }

  CATCH_SECTION("a handler error ends the call without a response") {
    auto failed = client.unary_call(FaultRequest{FaultKind::RETURNS_ERROR});
    CATCH_REQUIRE(!failed.has_value());
    CATCH_REQUIRE(failed.error() == ecode::connection_closed);
  }

  CATCH_SECTION("a live stream doesn't block other calls") {
    auto stream = client.server_streaming_call(CountRequest{});
    CATCH_REQUIRE(stream.has_value());
    CATCH_REQUIRE(stream->next().has_value());

    auto response = client.unary_call(FaultRequest{FaultKind::NONE});
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->value == 7);
  }

  CATCH_SECTION("many live streams don't block other calls") {
    using StreamType = std::decay_t<decltype(*client.server_streaming_call(CountRequest{}))>;
    std::vector<StreamType> streams;
    for (int i = 0; i < 6; ++i) {
      auto stream = client.server_streaming_call(CountRequest{});
      CATCH_REQUIRE(stream.has_value());
      CATCH_REQUIRE(stream->next().has_value());
      streams.push_back(std::move(*stream));
    }

    auto response = client.unary_call(FaultRequest{FaultKind::NONE});
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->value == 7);

    // ...and every stream still flows
    for (auto& stream : streams) {
      auto item = stream.next();
      CATCH_REQUIRE(item.has_value());
      CATCH_REQUIRE(item->has_value());
      CATCH_REQUIRE((*item)->value == 1);
    }
  }
}

} // namespace weft::rpc::tests
