#ifndef PLUGRT_FRAMEWORK_IO_CONTEXT_POOL_HPP
#define PLUGRT_FRAMEWORK_IO_CONTEXT_POOL_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <thread>
#include <vector>
#include <mutex>

namespace plugrt::framework
{
  // Worker threads that run plugin handlers. Every thread runs the same io_context.
  class IoContextPool
  {
  public:
    using Clock = std::chrono::steady_clock;

    explicit IoContextPool(unsigned int count)
      : state_(std::make_shared<State>())
    {
      // 保底使用 1 个线程
      if (count == 0) count = 1;

      threads_.reserve(count);
      for (unsigned int i = 0; i < count; ++i)
      {
        // 线程持有 state_ 的引用计数，被 detach 后仍可安全退出
        threads_.emplace_back([state = state_]()
        {
          state->ioc.run();
        });
      }
    }

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    ~IoContextPool()
    {
      stop();
    }

    boost::asio::io_context& get_io_context()
    {
      return state_->ioc;
    }

    boost::asio::io_context::executor_type get_executor()
    {
      return state_->ioc.get_executor();
    }

    size_t get_thread_count() const
    {
      return threads_.size();
    }

    // Handlers currently executing on a worker.
    size_t running() const
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      return state_->running;
    }

    // Runs handler on a worker; counted in running() while it executes.
    template <typename Handler>
    void post(Handler handler)
    {
      // a worker running this keeps the state alive
      boost::asio::post(state_->ioc, [state = state_.get(), handler = std::move(handler)]() mutable
      {
        RunningGuard guard(*state);
        handler();
      });
    }

    // Waits for every running handler; queued ones are dropped.
    void stop()
    {
      stop(Clock::time_point::max());
    }

    /**
     * @brief Stops the pool, waiting for running handlers only until deadline.
     * @return false if handlers were still running at the deadline. Their threads are
     *         detached and finish on their own.
     */
    bool stop(Clock::time_point deadline)
    {
      bool drained = true;
      std::call_once(stop_flag_, [this, deadline, &drained]()
      {
        state_->work_guard.reset();
        state_->ioc.stop();

        const bool on_worker = std::any_of(threads_.begin(), threads_.end(), [](const std::thread& t)
        {
          return t.get_id() == std::this_thread::get_id();
        });

        {
          std::unique_lock<std::mutex> lock(state_->mutex);
          // the calling handler itself never finishes while we wait
          const size_t self = on_worker ? 1 : 0;
          auto idle = [this, self]() { return state_->running <= self; };
          if (deadline == Clock::time_point::max())
          {
            state_->idle_cv.wait(lock, idle);
          }
          else
          {
            drained = state_->idle_cv.wait_until(lock, deadline, idle);
          }
        }

        for (auto& t : threads_)
        {
          if (!drained || t.get_id() == std::this_thread::get_id())
          {
            // stuck in a handler, or stop() called from one of our own handlers
            t.detach();
          }
          else if (t.joinable())
          {
            t.join();
          }
        }
        threads_.clear();
      });
      return drained;
    }

  private:
    struct State
    {
      State() : work_guard(boost::asio::make_work_guard(ioc))
      {
      }

      boost::asio::io_context ioc;
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard;
      mutable std::mutex mutex;
      std::condition_variable idle_cv;
      size_t running = 0;
    };

    class RunningGuard
    {
    public:
      explicit RunningGuard(State& state) : state_(state)
      {
        std::lock_guard<std::mutex> lock(state_.mutex);
        ++state_.running;
      }

      ~RunningGuard()
      {
        {
          std::lock_guard<std::mutex> lock(state_.mutex);
          --state_.running;
        }
        state_.idle_cv.notify_all();
      }

      RunningGuard(const RunningGuard&) = delete;
      RunningGuard& operator=(const RunningGuard&) = delete;

    private:
      State& state_;
    };

    std::shared_ptr<State> state_;
    std::vector<std::thread> threads_;
    std::once_flag stop_flag_;
  };
}

#endif // PLUGRT_FRAMEWORK_IO_CONTEXT_POOL_HPP
