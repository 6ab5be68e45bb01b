
#include "stdinc.hpp"

#include "weft/async/pipe.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>

namespace weft::async::tests {

CATCH_TEST_CASE("Pipe", "[pipe]") {
  CATCH_SECTION("items arrive in send order") {
    auto [tx, rx] = make_pipe<int>(4);
    CATCH_REQUIRE(tx.send(1));
    CATCH_REQUIRE(tx.send(2));
    CATCH_REQUIRE(tx.send(3));
    tx.close();
    CATCH_REQUIRE(rx.recv() == 1);
    CATCH_REQUIRE(rx.recv() == 2);
    CATCH_REQUIRE(rx.recv() == 3);
    CATCH_REQUIRE(!rx.recv().has_value());
  }

  CATCH_SECTION("every sender must close before end-of-stream") {
    auto [tx, rx] = make_pipe<int>(4);
    auto tx2 = tx;
    tx.close();
    CATCH_REQUIRE(tx2.send(5));
    tx2.close();
    CATCH_REQUIRE(rx.recv() == 5);
    CATCH_REQUIRE(!rx.recv().has_value());
  }

  CATCH_SECTION("a full pipe blocks the sender") {
    auto [tx, rx] = make_pipe<int>(1);
    CATCH_REQUIRE(tx.send(1));

    std::atomic<bool> is_sent{false};
    std::thread sender{[&tx = tx, &is_sent]() {
      tx.send(2);
      is_sent = true;
    }};

    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    CATCH_REQUIRE(!is_sent.load());
    CATCH_REQUIRE(rx.recv() == 1);
    sender.join();
    CATCH_REQUIRE(is_sent.load());
    CATCH_REQUIRE(rx.recv() == 2);
  }

  CATCH_SECTION("capacity 0 behaves as capacity 1") {
    auto [tx, rx] = make_pipe<int>(0);
    CATCH_REQUIRE(tx.send(1));
    CATCH_REQUIRE(rx.size() == 1);
    CATCH_REQUIRE(rx.recv() == 1);
  }

  CATCH_SECTION("dropping the receiver fails sends") {
    auto [tx, rx] = make_pipe<int>(1);
    CATCH_REQUIRE(tx.send(1));

    std::atomic<bool> was_sent{true};
    std::thread sender{[&tx = tx, &was_sent]() { was_sent = tx.send(2); }};
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    rx.close(); // releases the blocked sender
    sender.join();

    CATCH_REQUIRE(!was_sent.load());

    CATCH_REQUIRE(tx.is_closed());
    CATCH_REQUIRE(!tx.send(3));
  }
}

} // namespace weft::async::tests
