#pragma once
#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace util
{

using Task    = std::function<void()>;
using TimerId = std::uint64_t;

// Serial execution domain. Every task posted to one executor runs on one logical thread,
// in post order; timers fire in due order.
struct IExecutor
{
    virtual void    post(Task t)                             = 0;
    virtual TimerId schedule(std::uint64_t delay_ms, Task t) = 0;
    virtual bool    cancel(TimerId id)                       = 0;  // false if already fired
    // Run t on the executor and return after it ran (inline when already on it).
    // false when the executor is stopped and t did not run.
    virtual bool    dispatch_sync(Task t)                    = 0;
    virtual ~IExecutor() = default;
};

class ThreadExecutor final : public IExecutor
{
  public:
    ThreadExecutor();
    ~ThreadExecutor() override;

    void    post(Task t) override;
    TimerId schedule(std::uint64_t delay_ms, Task t) override;
    bool    cancel(TimerId id) override;
    bool    dispatch_sync(Task t) override;

    // Drains queued tasks, drops pending timers and joins the worker.
    void stop();
    bool in_loop() const { return std::this_thread::get_id() == worker_id_; }

  private:
    void run();

    using Clock = std::chrono::steady_clock;
    struct Timer
    {
        TimerId id;
        Task    fn;
    };

    mutable std::mutex                       mu_;
    std::condition_variable                  cv_;
    std::deque<Task>                         tasks_;
    std::multimap<Clock::time_point, Timer>  timers_;
    TimerId                                  next_id_{1};
    bool                                     stopping_{false};
    std::thread                              worker_;
    std::thread::id                          worker_id_{};
};

// Single-threaded executor driven by the caller, with virtual time. Used by tests.
class ManualExecutor final : public IExecutor
{
  public:
    void    post(Task t) override;
    TimerId schedule(std::uint64_t delay_ms, Task t) override;
    bool    cancel(TimerId id) override;
    bool    dispatch_sync(Task t) override;

    // Run queued tasks (including ones they post) until the queue is empty.
    std::size_t   run_pending();
    // Move virtual time forward, firing due timers and the tasks they post.
    void          advance(std::uint64_t ms);
    std::uint64_t now_ms() const { return now_ms_; }
    std::size_t   pending_timers() const { return timers_.size(); }

  private:
    struct Timer
    {
        TimerId id;
        Task    fn;
    };
    std::deque<Task>                       tasks_;
    std::multimap<std::uint64_t, Timer>    timers_;
    TimerId                                next_id_{1};
    std::uint64_t                          now_ms_{0};
};

}  // namespace util
