
#include "stdinc.hpp"

#include "periodic-task.hpp"

#include <boost/asio/steady_timer.hpp>

#include <mutex>

namespace weft::async {

struct PeriodicTask::Pimpl : public std::enable_shared_from_this<PeriodicTask::Pimpl> {
  mutable std::mutex padlock_;
  boost::asio::steady_timer timer_;
  duration_type period_;
  thunk_type thunk_;
  uint64_t run_count_{0};
  bool is_stopped_{false};

  Pimpl(boost::asio::any_io_executor executor, duration_type period, thunk_type thunk)
      : timer_{std::move(executor)}, period_{period}, thunk_{std::move(thunk)} {}

  void schedule_locked_() {
    timer_.expires_after(period_);
    timer_.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
      if (ec)
        return; // cancelled
      if (auto self = weak.lock())
        self->fire_();
    });
  }

  void fire_() {
    {
      std::lock_guard lock{padlock_};
      if (is_stopped_)
        return;
    }

    try {
      thunk_();
    } catch (const std::exception& e) {
      LOG_ERR("periodic task threw: {}", e.what());
    }

    std::lock_guard lock{padlock_};
    ++run_count_;
    if (!is_stopped_)
      schedule_locked_();
  }

  void stop() {
    std::lock_guard lock{padlock_};
    if (is_stopped_)
      return;
    is_stopped_ = true;
    timer_.cancel();
  }
};

PeriodicTask::PeriodicTask(boost::asio::any_io_executor executor, duration_type period,
                           thunk_type thunk)
    : pimpl_{std::make_shared<Pimpl>(std::move(executor), period, std::move(thunk))} {
  Expects(pimpl_->thunk_);
  std::lock_guard lock{pimpl_->padlock_};
  pimpl_->schedule_locked_();
}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::stop() {
  if (pimpl_)
    pimpl_->stop();
}

bool PeriodicTask::is_stopped() const {
  if (!pimpl_)
    return true;
  std::lock_guard lock{pimpl_->padlock_};
  return pimpl_->is_stopped_;
}

uint64_t PeriodicTask::run_count() const {
  if (!pimpl_)
    return 0;
  std::lock_guard lock{pimpl_->padlock_};
  return pimpl_->run_count_;
}

} // namespace weft::async
