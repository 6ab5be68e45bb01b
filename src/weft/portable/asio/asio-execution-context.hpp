
#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <cassert>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace weft {

/**
 * @defgroup weft-asio Weft Asio
 *
 * Asio provides the execution context (a thread pool) that runs rpc tasks, and the timers
 * that drive periodic work.
 */

/**
 * @ingroup weft-asio
 * @brief An `io_context` served by a fixed pool of threads.
 *
 * The context is kept alive by a work guard until `stop` is called, so the pool can be started
 * before any work is posted. An accept loop holds one thread until its endpoint closes, so size
 * the pool for the number of accept loops, plus one for timers.
 */
class AsioExecutionContext {
private:
  using WorkGuardType = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context io_context_;
  std::optional<WorkGuardType> work_guard_;
  std::size_t size_;
  std::vector<std::thread> pool_;

public:
  using ExecutorType = boost::asio::any_io_executor;
  using SteadyTimerType = boost::asio::steady_timer;

  explicit AsioExecutionContext(std::size_t thread_pool_size = 0)
      : work_guard_{boost::asio::make_work_guard(io_context_)},
        size_{thread_pool_size == 0 ? std::max(2u, std::thread::hardware_concurrency())
                                    : thread_pool_size} {
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() {
    stop();
    for (auto& thread : pool_)
      thread.join();
  }

  /** @brief Run the pool */
  void run() {
    assert(!is_running());
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Release the work guard, and abandon pending handlers. Running handlers complete. */
  void stop() {
    work_guard_.reset();
    io_context_.stop();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }

  /** @brief Return the executor for running jobs on the server pool */
  ExecutorType get_executor() { return io_context_.get_executor(); }

  /** @brief Submit `work` to the pool */
  template <typename F> void post(F&& work) {
    boost::asio::post(io_context_, std::forward<F>(work));
  }

  /** @brief Create a new steady timer bound to this execution context */
  SteadyTimerType make_steady_timer() { return SteadyTimerType{io_context_}; }
};

} // namespace weft
