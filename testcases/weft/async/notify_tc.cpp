
#include "stdinc.hpp"

#include "weft/async/notify.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <thread>
#include <vector>

namespace weft::async::tests {

CATCH_TEST_CASE("Notify", "[notify]") {
  CATCH_SECTION("a wake before the wait is not lost") {
    Notify notify;
    const auto seen = notify.generation();
    notify.notify_waiters();
    CATCH_REQUIRE(notify.wait_past(seen));
    CATCH_REQUIRE(notify.generation() == seen + 1);
  }

  CATCH_SECTION("wakes every waiter") {
    Notify notify;
    const auto seen = notify.generation();
    std::atomic<int> woken{0};
    std::vector<std::thread> waiters;
    for (auto i = 0; i < 4; ++i)
      waiters.emplace_back([&]() {
        if (notify.wait_past(seen))
          ++woken;
      });
    notify.notify_waiters();
    for (auto& waiter : waiters)
      waiter.join();
    CATCH_REQUIRE(woken.load() == 4);
  }

  CATCH_SECTION("close releases waiters") {
    Notify notify;
    std::atomic<bool> was_woken{true};
    std::thread waiter{[&]() { was_woken = notify.wait_past(notify.generation()); }};
    notify.close();
    waiter.join();
    CATCH_REQUIRE(!was_woken.load());
    CATCH_REQUIRE(notify.is_closed());
  }
}

} // namespace weft::async::tests
