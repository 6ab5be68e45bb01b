
#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace weft::async {

/**
 * @ingroup async
 * @brief Broadcast wake signal.
 *
 * `notify_waiters` wakes everyone currently waiting, and bumps a generation counter. A waiter
 * remembers the generation it last saw, and `wait_past` returns as soon as a newer one exists,
 * so a wake that happens between reading the generation and waiting is never lost. Wakes are
 * not queued: many wakes while a waiter is busy collapse into one.
 */
class Notify {
private:
  mutable std::mutex padlock_;
  std::condition_variable cv_;
  uint64_t generation_{0};
  bool is_closed_{false};

public:
  /** @brief The number of wakes so far */
  uint64_t generation() const {
    std::lock_guard lock{padlock_};
    return generation_;
  }

  /** @brief Wake all current waiters */
  void notify_waiters() {
    {
      std::lock_guard lock{padlock_};
      ++generation_;
    }
    cv_.notify_all();
  }

  /**
   * @brief Block until a wake newer than `seen` has happened.
   * @return false iff the signal was closed; no further wakes will come.
   */
  bool wait_past(uint64_t seen) {
    std::unique_lock lock{padlock_};
    cv_.wait(lock, [this, seen]() { return is_closed_ || generation_ > seen; });
    return !is_closed_;
  }

  /** @brief Release all waiters for good */
  void close() {
    {
      std::lock_guard lock{padlock_};
      is_closed_ = true;
    }
    cv_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard lock{padlock_};
    return is_closed_;
  }
};

} // namespace weft::async
