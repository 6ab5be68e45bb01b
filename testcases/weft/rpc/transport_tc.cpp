
#include "stdinc.hpp"

#include "test-utils.hpp"

#include "weft/rpc/transport/mem-connection.hpp"
#include "weft/rpc/transport/wire-connection.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <string>
#include <thread>

namespace weft::rpc::tests {

namespace {
  using Req = std::string;
  using Res = int64_t;

  static_assert(Connection<mem::Connection<Res, Req>>);
  static_assert(Endpoint<mem::Endpoint<Req, Res>>);
  static_assert(Connection<wire::Connection<Res, Req>>);
  static_assert(Endpoint<wire::Endpoint<Req, Res>>);
  static_assert(!Connection<mem::Endpoint<Req, Res>>);
} // namespace

CATCH_TEMPLATE_TEST_CASE("Transport", "[transport]", MemTransport, WireTransport) {
  auto [endpoint, conn] = TestType::template connection<Req, Res>(4);

  CATCH_SECTION("open and accept pair up one channel") {
    auto client = conn.open();
    CATCH_REQUIRE(client.has_value());
    auto server = endpoint.accept();
    CATCH_REQUIRE(server.has_value());

    CATCH_REQUIRE(!client->first.send("hello"));
    CATCH_REQUIRE(!client->first.send("world"));

    auto first = server->second.next();
    CATCH_REQUIRE(first.has_value());
    CATCH_REQUIRE(first->has_value());
    CATCH_REQUIRE(**first == "hello");
    CATCH_REQUIRE(**server->second.next() == "world");

    CATCH_REQUIRE(!server->first.send(42));
    CATCH_REQUIRE(**client->second.next() == 42);
  }

  CATCH_SECTION("channels are independent") {
    auto a = conn.open();
    auto b = conn.open();
    auto server_a = endpoint.accept();
    auto server_b = endpoint.accept();
    CATCH_REQUIRE((a && b && server_a && server_b));

    CATCH_REQUIRE(!b->first.send("to b"));
    CATCH_REQUIRE(!a->first.send("to a"));
    CATCH_REQUIRE(**server_a->second.next() == "to a");
    CATCH_REQUIRE(**server_b->second.next() == "to b");
  }

  CATCH_SECTION("closing one direction leaves the other open") {
    auto client = conn.open();
    auto server = endpoint.accept();
    CATCH_REQUIRE((client && server));

    CATCH_REQUIRE(!client->first.send("last"));
    client->first.close();
    CATCH_REQUIRE(**server->second.next() == "last");
    CATCH_REQUIRE(!server->second.next().has_value());

    CATCH_REQUIRE(!server->first.send(1));
    CATCH_REQUIRE(!server->first.send(2));
    server->first.close();
    CATCH_REQUIRE(**client->second.next() == 1);
    CATCH_REQUIRE(**client->second.next() == 2);
    CATCH_REQUIRE(!client->second.next().has_value());
  }

  CATCH_SECTION("sending to a dropped stream fails") {
    auto client = conn.open();
    CATCH_REQUIRE(client.has_value());
    {
      auto server = endpoint.accept();
      CATCH_REQUIRE(server.has_value());
    }
    CATCH_REQUIRE(client->first.send("anyone?") == ecode::transport_error);
    CATCH_REQUIRE(!client->second.next().has_value());
  }

  CATCH_SECTION("a full channel blocks the sender") {
    auto client = conn.open();
    auto server = endpoint.accept();
    CATCH_REQUIRE((client && server));

    std::atomic<int> sent{0};
    std::thread producer{[&sink = client->first, &sent]() {
      for (int i = 0; i < 10; ++i) {
        if (sink.send(std::to_string(i)))
          break;
        ++sent;
      }
    }};

    CATCH_REQUIRE(wait_until([&sent]() { return sent.load() == 4; }));
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    CATCH_REQUIRE(sent.load() == 4);

    for (int i = 0; i < 10; ++i) {
      auto item = server->second.next();
      CATCH_REQUIRE(item.has_value());
      CATCH_REQUIRE(**item == std::to_string(i));
    }
    producer.join();
    CATCH_REQUIRE(sent.load() == 10);
  }

  CATCH_SECTION("open fails once the endpoint is gone") {
    { auto dropped = std::move(endpoint); }
    auto client = conn.open();
    CATCH_REQUIRE(!client.has_value());
    CATCH_REQUIRE(client.error() == ecode::connection_closed);
  }

  CATCH_SECTION("accept ends once every connection is gone") {
    auto copy = conn;
    auto client = copy.open();
    CATCH_REQUIRE(client.has_value());
    { auto dropped = std::move(conn); }
    { auto dropped = std::move(copy); }

    // Channels opened before the close are still delivered
    auto server = endpoint.accept();
    CATCH_REQUIRE(server.has_value());

    auto next = endpoint.accept();
    CATCH_REQUIRE(!next.has_value());
    CATCH_REQUIRE(next.error() == ecode::endpoint_closed);
  }
}

CATCH_TEST_CASE("WireTransport", "[transport]") {
  auto [endpoint, conn] = wire::connection<Req, Res>();
  auto client = conn.open();
  auto server = endpoint.accept();
  CATCH_REQUIRE((client && server));

  CATCH_SECTION("a message that can't be encoded is not sent") {
    const std::string huge(k_max_string_size + 1, 'x');
    CATCH_REQUIRE(client->first.send(huge) == ecode::serialization_error);

    // The channel is still usable
    CATCH_REQUIRE(!client->first.send("small"));
    CATCH_REQUIRE(**server->second.next() == "small");
  }

  CATCH_SECTION("a frame that doesn't decode yields an error item") {
    // The client sends strings, but the server reads the frames as integers
    auto [frame_endpoint, frame_conn] = mem::connection<wire::FrameType, wire::FrameType>();
    const wire::Endpoint<int64_t, int64_t> raw_endpoint{std::move(frame_endpoint)};
    const wire::Connection<int64_t, std::string> raw_conn{std::move(frame_conn)};
    auto raw_client = raw_conn.open();
    auto raw_server = raw_endpoint.accept();
    CATCH_REQUIRE((raw_client && raw_server));

    CATCH_REQUIRE(!raw_client->first.send(std::string{"abc"}));
    auto item = raw_server->second.next();
    CATCH_REQUIRE(item.has_value());
    CATCH_REQUIRE(!item->has_value());
    CATCH_REQUIRE(item->error() == ecode::serialization_error);
  }
}

} // namespace weft::rpc::tests
