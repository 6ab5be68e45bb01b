
#include "stdinc.hpp"

#include "weft/async/periodic-task.hpp"
#include "weft/portable/asio/asio-execution-context.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace weft::async::tests {

namespace {
  template <typename Predicate> bool wait_until(Predicate predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (!predicate()) {
      if (std::chrono::steady_clock::now() > deadline)
        return false;
      std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }
    return true;
  }
} // namespace

CATCH_TEST_CASE("PeriodicTask", "[periodic-task]") {
  AsioExecutionContext pool{2};
  pool.run();

  CATCH_SECTION("runs repeatedly until stopped") {
    auto counter = std::make_shared<std::atomic<int>>(0);
    PeriodicTask task{pool.get_executor(), std::chrono::milliseconds{5}, [counter]() {
                        ++*counter;
                      }};
    CATCH_REQUIRE(wait_until([&]() { return counter->load() >= 3; }));

    task.stop();
    CATCH_REQUIRE(task.is_stopped());
    const auto stopped_at = counter->load();
    std::this_thread::sleep_for(std::chrono::milliseconds{30});
    CATCH_REQUIRE(counter->load() <= stopped_at + 1); // a run in progress may complete
  }

  CATCH_SECTION("a throwing thunk keeps running") {
    auto counter = std::make_shared<std::atomic<int>>(0);
    PeriodicTask task{pool.get_executor(), std::chrono::milliseconds{5}, [counter]() {
                        ++*counter;
                        throw std::runtime_error("thunk failure");
                      }};
    CATCH_REQUIRE(wait_until([&]() { return counter->load() >= 3; }));
    CATCH_REQUIRE(wait_until([&]() { return task.run_count() >= 2; }));
  }
}

} // namespace weft::async::tests
