
#include "stdinc.hpp"

#include "clock-service.hpp"

#include "weft/utils/serialize.hpp"

#include <mutex>

namespace weft::demo::clock {

// ----------------------------------------------------------------------------------------- Codec

error_code write(std::ostream&, const TickRequest&) { return {}; }
error_code read(std::istream&, TickRequest&) { return {}; }

error_code write(std::ostream& out, const TickResponse& x) { return weft::write_u64(out, x.tick); }
error_code read(std::istream& in, TickResponse& x) { return weft::read_u64(in, x.tick); }

// ------------------------------------------------------------------------------------ TickSource

std::optional<TickResponse> TickSource::next() {
  if (is_started_) {
    if (!state_->notify.wait_past(seen_))
      return std::nullopt;
  } else if (state_->notify.is_closed()) {
    return std::nullopt;
  }
  is_started_ = true;

  // Read the generation first: an increment after this point wakes the next `wait_past`
  seen_ = state_->notify.generation();
  std::shared_lock lock{state_->padlock};
  return TickResponse{state_->counter};
}

// ---------------------------------------------------------------------------------------- Ticker

struct Handler::Ticker {
  std::shared_ptr<detail::TickState> state;
  async::PeriodicTask task;

  Ticker(std::shared_ptr<detail::TickState> s, boost::asio::any_io_executor executor,
         std::chrono::milliseconds period)
      : state{s}, task{std::move(executor), period, [s]() {
                         {
                           std::unique_lock lock{s->padlock};
                           ++s->counter;
                         }
                         s->notify.notify_waiters();
                       }} {}

  Ticker(const Ticker&) = delete;
  Ticker& operator=(const Ticker&) = delete;
  ~Ticker() { stop(); }

  void stop() {
    task.stop();
    state->notify.close();
  }
};

// --------------------------------------------------------------------------------------- Handler

Handler::Handler(boost::asio::any_io_executor executor, std::chrono::milliseconds period)
    : state_{std::make_shared<detail::TickState>()},
      ticker_{std::make_shared<Ticker>(state_, std::move(executor), period)} {}

TickSource Handler::tick(TickRequest) const {
  TRACE("new tick subscription at {}", current_tick());
  return TickSource{state_};
}

uint64_t Handler::current_tick() const {
  std::shared_lock lock{state_->padlock};
  return state_->counter;
}

void Handler::stop() const { ticker_->stop(); }

} // namespace weft::demo::clock
