/*
 * File: include/lanwake/fleet_poller.hpp
 * Project: LanWake
 * Purpose: Background reachability polling of every known machine
 * Notes:
 *  - See DESIGN.md
 *  - Status is keyed by machine id; entries are created on first check and never removed
 *  - Interval changes are deferred to the next firing of the armed timer
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "lanwake/log.hpp"
#include "lanwake/machine.hpp"
#include "lanwake/prober.hpp"
#include "lanwake/scheduler.hpp"
#include "lanwake/settings.hpp"

namespace lanwake
{

struct MachineStatus
{
    bool reachable = false;
    std::optional<Scheduler::WallTime> last_checked;
    bool checking = false;
};

class FleetStatusPoller
{
public:
    using Listener = std::function<void(const std::string &machine_id, const MachineStatus &)>;
    using Done = std::function<void()>;

    FleetStatusPoller(Scheduler &scheduler, ReachabilityProber &prober, const Settings &settings)
        : scheduler_(scheduler), prober_(prober), settings_(settings), interval_(settings.status_interval)
    {
    }

    ~FleetStatusPoller() { stop(); }

    FleetStatusPoller(const FleetStatusPoller &) = delete;
    FleetStatusPoller &operator=(const FleetStatusPoller &) = delete;

    // Immediate check_all, then one pass per interval.
    void start(std::vector<Machine> machines, std::chrono::seconds interval)
    {
        require_positive(interval);
        stop();
        machines_ = std::move(machines);
        interval_ = interval;
        pending_interval_.reset();
        log::info("fleet", "polling " + std::to_string(machines_.size()) + " machines every " +
                               std::to_string(interval_.count()) + "s");
        check_all(machines_);
        arm();
    }

    void stop()
    {
        if (timer_)
            scheduler_.cancel(*timer_);
        timer_.reset();
        next_check_.reset();
    }

    // Re-arms without an immediate pass (the caller just refreshed by hand).
    void reset(std::vector<Machine> machines, std::chrono::seconds interval)
    {
        require_positive(interval);
        stop();
        machines_ = std::move(machines);
        interval_ = interval;
        pending_interval_.reset();
        arm();
    }

    void set_pending_interval(std::chrono::seconds interval)
    {
        require_positive(interval);
        pending_interval_ = interval;
        log::info("fleet", "interval change to " + std::to_string(interval.count()) + "s pending until next check");
    }

    void check_all(const std::vector<Machine> &machines, Done all_done = {})
    {
        if (machines.empty())
        {
            log::info("fleet", "All status checks completed (no machines)");
            if (all_done)
                all_done();
            return;
        }
        auto remaining = std::make_shared<std::size_t>(machines.size());
        for (const auto &m : machines)
        {
            check_machine(m, [remaining, all_done](bool)
                          {
                if (--*remaining != 0)
                    return;
                log::info("fleet", "All status checks completed");
                if (all_done)
                    all_done(); });
        }
    }

    void check_machine(const Machine &machine, std::function<void(bool)> done = {})
    {
        const std::string id = machine.id;
        ++in_flight_[id];
        status_[id].checking = true;
        notify(id);

        std::weak_ptr<int> alive = lifetime_;
        prober_.probe(machine.ipv4_address, machine.ping_port, settings_.status_probe_timeout,
                      [this, alive, id, done](bool reachable)
                      {
                          if (alive.expired())
                              return;
                          // result, timestamp and checking flag land in one step
                          auto &st = status_[id];
                          st.reachable = reachable;
                          st.last_checked = scheduler_.wall_now();
                          if (--in_flight_[id] <= 0)
                          {
                              in_flight_.erase(id);
                              st.checking = false;
                          }
                          notify(id);
                          if (done)
                              done(reachable);
                      });
    }

    // Result learned outside a status check, e.g. a successful wake.
    void record(const std::string &machine_id, bool reachable)
    {
        auto &st = status_[machine_id];
        st.reachable = reachable;
        st.last_checked = scheduler_.wall_now();
        notify(machine_id);
    }

    MachineStatus status(const std::string &machine_id) const
    {
        auto it = status_.find(machine_id);
        return it == status_.end() ? MachineStatus{} : it->second;
    }

    bool is_reachable(const std::string &machine_id) const { return status(machine_id).reachable; }
    bool is_checking(const std::string &machine_id) const { return status(machine_id).checking; }

    const std::map<std::string, MachineStatus> &statuses() const { return status_; }
    const std::vector<Machine> &machines() const { return machines_; }
    std::chrono::seconds interval() const { return interval_; }
    std::optional<std::chrono::seconds> pending_interval() const { return pending_interval_; }
    bool running() const { return timer_.has_value(); }

    std::optional<Scheduler::TimePoint> next_check() const { return next_check_; }

    // Wall-clock form of next_check() for countdown displays.
    std::optional<Scheduler::WallTime> next_check_date() const
    {
        if (!next_check_)
            return std::nullopt;
        auto left = *next_check_ - scheduler_.now();
        return scheduler_.wall_now() + std::chrono::duration_cast<std::chrono::system_clock::duration>(left);
    }

    int subscribe(Listener l)
    {
        const int id = next_listener_++;
        listeners_.emplace(id, std::move(l));
        return id;
    }

    void unsubscribe(int id) { listeners_.erase(id); }

private:
    static void require_positive(std::chrono::seconds interval)
    {
        if (interval.count() <= 0)
            throw std::invalid_argument("status interval must be positive");
    }

    void arm()
    {
        next_check_ = scheduler_.now() + interval_;
        timer_ = scheduler_.schedule_after(interval_, [this]
                                           { on_timer(); });
    }

    void on_timer()
    {
        timer_.reset();
        if (pending_interval_)
        {
            log::info("fleet", "applying interval " + std::to_string(pending_interval_->count()) + "s");
            interval_ = *pending_interval_;
            pending_interval_.reset();
        }
        check_all(machines_);
        arm();
    }

    void notify(const std::string &id)
    {
        const MachineStatus st = status_[id];
        auto ls = listeners_;
        for (auto &kv : ls)
            kv.second(id, st);
    }

    Scheduler &scheduler_;
    ReachabilityProber &prober_;
    const Settings &settings_;

    std::vector<Machine> machines_;
    std::chrono::seconds interval_;
    std::optional<std::chrono::seconds> pending_interval_;
    std::optional<Scheduler::TaskId> timer_;
    std::optional<Scheduler::TimePoint> next_check_;

    std::map<std::string, MachineStatus> status_;
    std::map<std::string, int> in_flight_;
    std::map<int, Listener> listeners_;
    int next_listener_ = 1;
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

} // namespace lanwake
