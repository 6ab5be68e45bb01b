
#pragma once

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace weft::async {

/**
 * @ingroup async
 * @brief Runs a thunk every `period` on an asio executor, until stopped or destroyed.
 *
 * The first run happens one `period` after construction. Runs never overlap: the next run is
 * scheduled once the current thunk returns. Exceptions thrown by the thunk are logged, and do
 * not stop the task.
 */
class PeriodicTask {
public:
  using thunk_type = std::function<void()>;
  using duration_type = std::chrono::steady_clock::duration;

private:
  struct Pimpl;
  std::shared_ptr<Pimpl> pimpl_;

public:
  PeriodicTask(boost::asio::any_io_executor executor, duration_type period, thunk_type thunk);
  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask(PeriodicTask&&) = default;
  ~PeriodicTask();
  PeriodicTask& operator=(const PeriodicTask&) = delete;
  PeriodicTask& operator=(PeriodicTask&&) = default;

  /** @brief Cancel the pending run. A run in progress completes. Idempotent. */
  void stop();

  bool is_stopped() const;

  /** @brief Number of times the thunk has completed */
  uint64_t run_count() const;
};

} // namespace weft::async
