/*
 * File: include/lanwake/scheduler.hpp
 * Project: LanWake
 * Purpose: Cancellable delayed-task queue for the control thread
 * Notes:
 *  - See DESIGN.md
 *  - All wake / fleet decisions run as tasks on one Scheduler
 *  - post() is the only member safe to call from other threads
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <boost/asio.hpp>

namespace lanwake
{

class Scheduler
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;
    using WallTime = std::chrono::system_clock::time_point;
    using Task = std::function<void()>;
    using TaskId = std::uint64_t;

    virtual ~Scheduler() = default;

    virtual TimePoint now() const = 0;
    virtual WallTime wall_now() const = 0;

    // Runs the task on the control thread as soon as possible.
    virtual void post(Task task) = 0;

    // A cancelled task never runs, even if its deadline already passed.
    virtual TaskId schedule_after(Duration delay, Task task) = 0;
    virtual bool cancel(TaskId id) = 0;
};

class AsioScheduler : public Scheduler
{
public:
    explicit AsioScheduler(boost::asio::io_context &ioc) : ioc_(ioc) {}

    ~AsioScheduler() override
    {
        for (auto &kv : timers_)
            kv.second->cancel();
    }

    AsioScheduler(const AsioScheduler &) = delete;
    AsioScheduler &operator=(const AsioScheduler &) = delete;

    TimePoint now() const override { return Clock::now(); }
    WallTime wall_now() const override { return std::chrono::system_clock::now(); }

    void post(Task task) override
    {
        boost::asio::post(ioc_, std::move(task));
    }

    TaskId schedule_after(Duration delay, Task task) override
    {
        const TaskId id = next_id_++;
        auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, delay);
        timers_.emplace(id, timer);
        timer->async_wait([this, id, timer, task = std::move(task)](const boost::system::error_code &ec)
                          {
            if (ec == boost::asio::error::operation_aborted)
                return;
            // cancel() may have raced a timer that had already expired
            auto it = timers_.find(id);
            if (it == timers_.end())
                return;
            timers_.erase(it);
            task(); });
        return id;
    }

    bool cancel(TaskId id) override
    {
        auto it = timers_.find(id);
        if (it == timers_.end())
            return false;
        it->second->cancel();
        timers_.erase(it);
        return true;
    }

    boost::asio::io_context &context() { return ioc_; }

private:
    boost::asio::io_context &ioc_;
    std::unordered_map<TaskId, std::shared_ptr<boost::asio::steady_timer>> timers_;
    TaskId next_id_ = 1;
};

} // namespace lanwake
