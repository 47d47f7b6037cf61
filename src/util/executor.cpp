#include <future>
#include <utility>

#include "util/executor.hpp"
#include "util/log.hpp"

namespace util
{

// ======================================================================
// ThreadExecutor
// - One worker thread owns every task; radio callbacks and public calls
//   meet here so engine state has a single writer.
// ======================================================================
ThreadExecutor::ThreadExecutor()
{
    worker_    = std::thread([this] { run(); });
    worker_id_ = worker_.get_id();
}

ThreadExecutor::~ThreadExecutor()
{
    stop();
}

void ThreadExecutor::post(Task t)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_)
        {
            LOG_DEBUG("executor stopping, task dropped");
            return;
        }
        tasks_.push_back(std::move(t));
    }
    cv_.notify_one();
}

TimerId ThreadExecutor::schedule(std::uint64_t delay_ms, Task t)
{
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_)
            return 0;
        id = next_id_++;
        timers_.emplace(Clock::now() + std::chrono::milliseconds(delay_ms),
                        Timer{id, std::move(t)});
    }
    cv_.notify_one();
    return id;
}

bool ThreadExecutor::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it)
    {
        if (it->second.id == id)
        {
            timers_.erase(it);
            return true;
        }
    }
    return false;
}

bool ThreadExecutor::dispatch_sync(Task t)
{
    if (in_loop())
    {
        t();
        return true;
    }
    std::promise<void> done;
    auto               fut = done.get_future();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_)
        {
            LOG_DEBUG("executor stopped, dispatch_sync dropped");
            return false;
        }
        tasks_.push_back([&t, &done] {
            t();
            done.set_value();
        });
    }
    cv_.notify_one();
    fut.wait();
    return true;
}

void ThreadExecutor::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_)
            return;
        stopping_ = true;
    }
    cv_.notify_one();
    // never join from inside the loop
    if (worker_.joinable())
    {
        if (in_loop())
            worker_.detach();
        else
            worker_.join();
    }
}

void ThreadExecutor::run()
{
    std::unique_lock<std::mutex> lk(mu_);
    while (true)
    {
        if (!tasks_.empty())
        {
            Task t = std::move(tasks_.front());
            tasks_.pop_front();
            lk.unlock();
            t();
            lk.lock();
            continue;
        }
        if (stopping_)
            break;
        if (!timers_.empty())
        {
            auto first = timers_.begin();
            if (first->first <= Clock::now())
            {
                Task t = std::move(first->second.fn);
                timers_.erase(first);
                lk.unlock();
                t();
                lk.lock();
                continue;
            }
            cv_.wait_until(lk, first->first);
            continue;
        }
        cv_.wait(lk);
    }
    timers_.clear();
}

// ======================================================================
// ManualExecutor
// ======================================================================
void ManualExecutor::post(Task t)
{
    tasks_.push_back(std::move(t));
}

TimerId ManualExecutor::schedule(std::uint64_t delay_ms, Task t)
{
    TimerId id = next_id_++;
    timers_.emplace(now_ms_ + delay_ms, Timer{id, std::move(t)});
    return id;
}

bool ManualExecutor::cancel(TimerId id)
{
    for (auto it = timers_.begin(); it != timers_.end(); ++it)
    {
        if (it->second.id == id)
        {
            timers_.erase(it);
            return true;
        }
    }
    return false;
}

bool ManualExecutor::dispatch_sync(Task t)
{
    t();
    return true;
}

std::size_t ManualExecutor::run_pending()
{
    std::size_t n = 0;
    while (!tasks_.empty())
    {
        Task t = std::move(tasks_.front());
        tasks_.pop_front();
        t();
        ++n;
    }
    return n;
}

void ManualExecutor::advance(std::uint64_t ms)
{
    const std::uint64_t target = now_ms_ + ms;
    run_pending();
    while (!timers_.empty() && timers_.begin()->first <= target)
    {
        auto it = timers_.begin();
        now_ms_ = it->first;
        Task t  = std::move(it->second.fn);
        timers_.erase(it);
        t();
        run_pending();
    }
    now_ms_ = target;
}

}  // namespace util
