
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace weft::async {

template <typename T> class PipeSender;
template <typename T> class PipeReceiver;

template <typename T> std::pair<PipeSender<T>, PipeReceiver<T>> make_pipe(std::size_t capacity);

namespace detail {
  /**
   * @private
   * @brief Shared state of a bounded multi-producer pipe.
   */
  template <typename T> class PipeState {
  private:
    mutable std::mutex padlock_;
    std::condition_variable readable_; //!< An item arrived, or the last sender left
    std::condition_variable writable_; //!< Space was freed, or the receiver left
    std::deque<T> queue_;
    std::size_t capacity_{1};
    std::size_t sender_count_{0};
    bool receiver_closed_{false};

  public:
    explicit PipeState(std::size_t capacity) : capacity_{capacity == 0 ? 1 : capacity} {}

    void add_sender() {
      std::lock_guard lock{padlock_};
      ++sender_count_;
    }

    void remove_sender() {
      bool last = false;
      {
        std::lock_guard lock{padlock_};
        last = (--sender_count_ == 0);
      }
      if (last)
        readable_.notify_all();
    }

    bool push(T&& value) {
      {
        std::unique_lock lock{padlock_};
        writable_.wait(lock, [this]() { return receiver_closed_ || queue_.size() < capacity_; });
        if (receiver_closed_)
          return false;
        queue_.push_back(std::move(value));
      }
      readable_.notify_one();
      return true;
    }

    std::optional<T> pop() {
      std::optional<T> value;
      {
        std::unique_lock lock{padlock_};
        readable_.wait(lock, [this]() { return !queue_.empty() || sender_count_ == 0; });
        if (queue_.empty())
          return std::nullopt;
        value.emplace(std::move(queue_.front()));
        queue_.pop_front();
      }
      writable_.notify_one();
      return value;
    }

    void close_receiver() {
      std::deque<T> discarded;
      {
        std::lock_guard lock{padlock_};
        receiver_closed_ = true;
        discarded.swap(queue_);
      }
      writable_.notify_all();
      // `discarded` may own other pipe ends; they are released outside the lock
    }

    bool is_receiver_closed() const {
      std::lock_guard lock{padlock_};
      return receiver_closed_;
    }

    std::size_t size() const {
      std::lock_guard lock{padlock_};
      return queue_.size();
    }
  };
} // namespace detail

// ------------------------------------------------------------------------------------ PipeSender

/**
 * @ingroup async
 * @brief The sending half of a bounded pipe. Copies are additional senders; the receiver sees
 *        end-of-stream once every sender has been closed or destroyed.
 */
template <typename T> class PipeSender {
private:
  std::shared_ptr<detail::PipeState<T>> state_;

  friend std::pair<PipeSender<T>, PipeReceiver<T>> make_pipe<T>(std::size_t capacity);

  explicit PipeSender(std::shared_ptr<detail::PipeState<T>> state) : state_{std::move(state)} {
    state_->add_sender();
  }

public:
  PipeSender() = default;
  PipeSender(const PipeSender& o) : state_{o.state_} {
    if (state_)
      state_->add_sender();
  }
  PipeSender(PipeSender&& o) noexcept : state_{std::move(o.state_)} {}
  ~PipeSender() { close(); }

  PipeSender& operator=(const PipeSender& o) {
    if (this != &o) {
      close();
      state_ = o.state_;
      if (state_)
        state_->add_sender();
    }
    return *this;
  }

  PipeSender& operator=(PipeSender&& o) noexcept {
    if (this != &o) {
      close();
      state_ = std::move(o.state_);
    }
    return *this;
  }

  /**
   * @brief Blocks while the pipe is full.
   * @return false iff the receiver is gone (or this sender was closed); `value` is dropped.
   */
  bool send(T value) const {
    if (!state_)
      return false;
    return state_->push(std::move(value));
  }

  /** @brief Stop sending. Idempotent. */
  void close() {
    if (state_) {
      state_->remove_sender();
      state_.reset();
    }
  }

  /** @brief true iff a `send` would fail without blocking */
  bool is_closed() const { return !state_ || state_->is_receiver_closed(); }
};

// ---------------------------------------------------------------------------------- PipeReceiver

/**
 * @ingroup async
 * @brief The receiving half of a bounded pipe. Destroying it (or calling `close`) makes every
 *        pending and future `send` fail.
 */
template <typename T> class PipeReceiver {
private:
  std::shared_ptr<detail::PipeState<T>> state_;

  friend std::pair<PipeSender<T>, PipeReceiver<T>> make_pipe<T>(std::size_t capacity);

  explicit PipeReceiver(std::shared_ptr<detail::PipeState<T>> state) : state_{std::move(state)} {}

public:
  PipeReceiver() = default;
  PipeReceiver(const PipeReceiver&) = delete;
  PipeReceiver(PipeReceiver&&) noexcept = default;
  ~PipeReceiver() { close(); }

  PipeReceiver& operator=(const PipeReceiver&) = delete;
  PipeReceiver& operator=(PipeReceiver&& o) noexcept {
    if (this != &o) {
      close();
      state_ = std::move(o.state_);
    }
    return *this;
  }

  /**
   * @brief Blocks until an item arrives.
   * @return `std::nullopt` once the pipe is drained and every sender has gone.
   */
  std::optional<T> recv() {
    if (!state_)
      return std::nullopt;
    return state_->pop();
  }

  /** @brief Alias of `recv`, so a receiver can be handed out as a produced sequence */
  std::optional<T> next() { return recv(); }

  /** @brief Stop receiving; queued items are discarded. Idempotent. */
  void close() {
    if (state_) {
      state_->close_receiver();
      state_.reset();
    }
  }

  /** @brief Number of items buffered, and not yet received */
  std::size_t size() const { return state_ ? state_->size() : 0; }
};

/**
 * @ingroup async
 * @brief Create a pipe that buffers at most `capacity` items (minimum 1).
 */
template <typename T> std::pair<PipeSender<T>, PipeReceiver<T>> make_pipe(std::size_t capacity) {
  auto state = std::make_shared<detail::PipeState<T>>(capacity);
  return {PipeSender<T>{state}, PipeReceiver<T>{state}};
}

} // namespace weft::async
