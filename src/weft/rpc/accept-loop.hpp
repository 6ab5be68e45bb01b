
#pragma once

#include "server.hpp"

#include "weft/utils/base-include.hpp"
#include "weft/utils/error-codes.hpp"

#include <atomic>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace weft::rpc {

/**
 * @ingroup rpc
 * @brief Something that serves the calls of service `S`: one entry point that receives the
 *        first message of a call and its channel, and returns the dispatch result.
 */
template <typename H, typename S, typename E>
concept RequestHandler = requires(const H& handler, typename S::Req request,
                                  RpcChannel<S, E> channel) {
  { handler.handle_rpc_request(std::move(request), std::move(channel)) }
      -> std::same_as<std::error_code>;
};

namespace detail {
  /**
   * @private
   * @brief The threads of the calls in flight. Finished threads are joined on the next
   *        `spawn`, and the rest on destruction.
   */
  class CallThreads {
  private:
    struct Call {
      std::thread thread;
      std::shared_ptr<std::atomic<bool>> is_done;
    };
    std::vector<Call> calls_;

  public:
    CallThreads() = default;
    CallThreads(const CallThreads&) = delete;
    CallThreads& operator=(const CallThreads&) = delete;
    ~CallThreads() {
      for (auto& call : calls_)
        call.thread.join();
    }

    /** @brief Number of calls that have not been reaped */
    std::size_t size() const { return calls_.size(); }

    template <typename F> void spawn(F&& thunk) {
      reap_();
      calls_.reserve(calls_.size() + 1);
      auto is_done = std::make_shared<std::atomic<bool>>(false);
      std::thread thread{[thunk = std::forward<F>(thunk), is_done]() mutable {
        thunk();
        is_done->store(true);
      }};
      calls_.push_back(Call{std::move(thread), std::move(is_done)});
    }

  private:
    void reap_() {
      std::erase_if(calls_, [](Call& call) {
        if (!call.is_done->load())
          return false;
        call.thread.join();
        return true;
      });
    }
  };
} // namespace detail

/**
 * @ingroup rpc
 * @brief Accept calls on `server` until its endpoint closes, running each call on a thread of
 *        its own.
 *
 * Blocks the calling thread. A call may block for as long as its peer keeps it open, so calls
 * never share threads, and never hold the threads of an execution context. A failed accept or a
 * failed call is logged, and the loop carries on; one faulty call never affects the others.
 * Returns once the endpoint is closed, and every call it started has finished.
 */
template <typename S, typename E, typename H>
requires RequestHandler<H, S, E>
void run_accept_loop(const RpcServer<S, E>& server, H handler) {
  detail::CallThreads calls;
  for (;;) {
    auto accepted = server.accept();
    if (!accepted) {
      if (accepted.error() == ecode::endpoint_closed) {
        TRACE("endpoint closed, waiting for {} call(s)", calls.size());
        return;
      }
      WARN("rpc accept failed: {}", accepted.error().message());
      continue;
    }

    try {
      calls.spawn([handler, call = std::move(*accepted)]() mutable {
        if (auto ec = handler.handle_rpc_request(std::move(call.first), std::move(call.second)))
          WARN("rpc call failed: {}", ec.message());
      });
    } catch (const std::system_error& e) {
      // The call's channel is dropped, so its client sees the connection close
      LOG_ERR("failed to start a thread for an rpc call: {}", e.what());
    }
  }
}

} // namespace weft::rpc
