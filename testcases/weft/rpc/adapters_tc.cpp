
#include "stdinc.hpp"

#include "test-utils.hpp"

#include "weft/demo/inner-service.hpp"

#include <catch2/catch.hpp>

#include <thread>
#include <vector>

namespace weft::rpc::tests {

namespace calc = demo::calc;
namespace clock = demo::clock;
namespace inner = demo::inner;

namespace {
  using CalcConnection = mem::Connection<calc::Service::Res, calc::Service::Req>;

  static_assert(Connection<BoxedServiceConnection<calc::Service>>);
  static_assert(Endpoint<BoxedServiceEndpoint<calc::Service>>);
  static_assert(
      Connection<MappedConnection<calc::Service::Res, calc::Service::Req,
                                  mem::Connection<inner::Service::Res, inner::Service::Req>>>);
  static_assert(!Endpoint<MappedConnection<calc::Service::Res, calc::Service::Req,
                                           mem::Connection<inner::Service::Res,
                                                           inner::Service::Req>>>);
} // namespace

// ------------------------------------------------------------------------------------- Boxed

CATCH_TEST_CASE("BoxedConnection", "[adapters]") {
  AsioExecutionContext pool{8};
  pool.run();

  CATCH_SECTION("mem and wire clients are interchangeable once boxed") {
    auto [mem_endpoint, mem_conn] = mem::connection<calc::Service::Req, calc::Service::Res>();
    auto [wire_endpoint, wire_conn] = wire::connection<calc::Service::Req, calc::Service::Res>();
    serve<calc::Service>(pool, std::move(mem_endpoint), calc::Handler{});
    serve<calc::Service>(pool, std::move(wire_endpoint), calc::Handler{});

    std::vector<RpcClient<calc::Service>> clients;
    clients.emplace_back(box_connection(std::move(mem_conn)));
    clients.emplace_back(box_connection(std::move(wire_conn)));
    clients.push_back(clients.front().boxed()); // boxing twice is a no-op

    for (const auto& client : clients) {
      auto sum = client.unary_call(calc::AddRequest{40, 2});
      CATCH_REQUIRE(sum.has_value());
      CATCH_REQUIRE(sum->value == 42);

      auto stream = client.server_streaming_call(calc::FibonacciRequest{4});
      CATCH_REQUIRE(stream.has_value());
      std::vector<uint64_t> values;
      for (auto item = stream->next(); item; item = stream->next())
        values.push_back((*item)->value);
      CATCH_REQUIRE(values == std::vector<uint64_t>{0, 1, 1, 2});
    }
  }

  CATCH_SECTION("a boxed endpoint serves a plain client") {
    auto [endpoint, conn] = mem::connection<calc::Service::Req, calc::Service::Res>();
    serve<calc::Service>(pool, box_endpoint(std::move(endpoint)), calc::Handler{});

    const RpcClient<calc::Service, CalcConnection> client{std::move(conn)};
    auto sum = client.unary_call(calc::AddRequest{-5, 5});
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(sum->value == 0);
  }

  CATCH_SECTION("a default boxed sink refuses to send") {
    BoxedSendSink<int> sink;
    CATCH_REQUIRE(sink.send(1) == ecode::connection_closed);
  }
}

// ------------------------------------------------------------------------------------ Mapped

CATCH_TEST_CASE("MappedConnection", "[adapters]") {
  using InnerEndpoint = mem::Endpoint<inner::Service::Req, inner::Service::Res>;
  using InnerConnection = mem::Connection<inner::Service::Res, inner::Service::Req>;

  auto [endpoint, conn] = mem::connection<inner::Service::Req, inner::Service::Res>();
  const RpcClient<inner::Service, InnerConnection> inner_client{std::move(conn)};

  CATCH_SECTION("a mapped client sends its requests wrapped") {
    std::thread server{[&endpoint = endpoint]() {
      auto socket = endpoint.accept();
      if (!socket)
        return;
      auto request = socket->second.next();
      if (!request || !*request)
        return;
      // Answer with the request's sum, to prove it arrived as an inner calc request
      const auto* calc_req = std::get_if<calc::Service::Req>(&**request);
      const auto* add = calc_req ? std::get_if<calc::AddRequest>(calc_req) : nullptr;
      const int64_t value = add ? add->a + add->b : -1;
      (void)socket->first.send(inner::Service::Res{calc::Service::Res{calc::AddResponse{value}}});
    }};

    const auto calc_client = inner_client.map<calc::Service>();
    auto sum = calc_client.unary_call(calc::AddRequest{2, 3});
    server.join();

    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(sum->value == 5);
  }

  CATCH_SECTION("a response from another service is a mapping error") {
    std::thread server{[&endpoint = endpoint]() {
      auto socket = endpoint.accept();
      if (!socket || !socket->second.next())
        return;
      (void)socket->first.send(inner::Service::Res{clock::Service::Res{clock::TickResponse{1}}});
    }};

    const auto calc_client = inner_client.map<calc::Service>();
    auto sum = calc_client.unary_call(calc::AddRequest{2, 3});
    server.join();

    CATCH_REQUIRE(!sum.has_value());
    CATCH_REQUIRE(sum.error() == ecode::mapping_error);
  }

  CATCH_SECTION("a mapped endpoint rejects requests of another service") {
    using CalcView = MappedConnection<calc::Service::Req, calc::Service::Res, InnerEndpoint>;
    const RpcServer<calc::Service, CalcView> server{CalcView{endpoint}};

    const auto clock_client = inner_client.map<clock::Service>();
    auto stream = clock_client.server_streaming_call(clock::TickRequest{});
    CATCH_REQUIRE(stream.has_value());

    auto accepted = server.accept();
    CATCH_REQUIRE(!accepted.has_value());
    CATCH_REQUIRE(accepted.error() == ecode::mapping_error);

    // ...but serves its own
    std::thread client{[&inner_client]() {
      (void)inner_client.map<calc::Service>().unary_call(calc::AddRequest{1, 1});
    }};
    auto next = server.accept();
    bool is_add = false;
    error_code ec = make_error_code(ecode::logic_error);
    if (next && std::holds_alternative<calc::AddRequest>(next->first)) {
      is_add = true;
      ec = std::move(next->second)
               .dispatch_unary(std::get<calc::AddRequest>(next->first), calc::Handler{},
                               &calc::Handler::add);
    }
    next = tl::make_unexpected(make_error_code(ecode::logic_error)); // releases the channel
    client.join();

    CATCH_REQUIRE(is_add);
    CATCH_REQUIRE(!ec);
  }

  CATCH_SECTION("mapping to the same service changes nothing") {
    AsioExecutionContext pool{4};
    pool.run();

    auto [calc_endpoint, calc_conn] = mem::connection<calc::Service::Req, calc::Service::Res>();
    serve<calc::Service>(pool, std::move(calc_endpoint), calc::Handler{});

    const RpcClient<calc::Service, CalcConnection> client{std::move(calc_conn)};
    auto sum = client.map<calc::Service>().unary_call(calc::AddRequest{20, 22});
    CATCH_REQUIRE(sum.has_value());
    CATCH_REQUIRE(sum->value == 42);
  }
}

} // namespace weft::rpc::tests
