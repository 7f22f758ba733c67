#ifndef PLUGRT_FRAMEWORK_CONTEXT_CALL_CONTEXT_HPP_
#define PLUGRT_FRAMEWORK_CONTEXT_CALL_CONTEXT_HPP_

#include <atomic>
#include <chrono>
#include <string>

namespace plugrt::framework
{
  /**
   * @brief Per-call information handed to a stage handler.
   *
   * The runtime raises the cancellation flag when the host cancels the call or the
   * deadline passes. Long-running handlers should poll is_cancelled() and return early;
   * whatever they return after that point is discarded.
   */
  class CallContext
  {
  public:
    using Clock = std::chrono::steady_clock;

    CallContext(std::string peer, Clock::time_point deadline)
      : peer_(std::move(peer)), deadline_(deadline)
    {
    }

    CallContext(const CallContext&) = delete;
    CallContext& operator=(const CallContext&) = delete;

    const std::string& peer() const { return peer_; }
    Clock::time_point deadline() const { return deadline_; }

    std::chrono::milliseconds remaining() const
    {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
      return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    void cancel() { cancelled_.store(true, std::memory_order_release); }

  private:
    const std::string peer_;
    const Clock::time_point deadline_;
    std::atomic<bool> cancelled_{false};
  };
}

#endif // PLUGRT_FRAMEWORK_CONTEXT_CALL_CONTEXT_HPP_
