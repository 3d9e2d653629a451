/*
 * File: include/lanwake/controller.hpp
 * Project: LanWake
 * Purpose: Session controller tying the machine list, wake session and fleet poller together
 * Notes:
 *  - See DESIGN.md
 *  - Runs entirely on the control thread
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "lanwake/fleet_poller.hpp"
#include "lanwake/log.hpp"
#include "lanwake/machine.hpp"
#include "lanwake/scheduler.hpp"
#include "lanwake/settings.hpp"
#include "lanwake/wake_orchestrator.hpp"

namespace lanwake
{

class Controller
{
public:
    Controller(Scheduler &scheduler, MagicPacketSender &transmitter,
               ReachabilityProber &prober, const Settings &settings)
        : scheduler_(scheduler),
          settings_(settings),
          wake_(scheduler, transmitter, prober, settings),
          fleet_(scheduler, prober, settings)
    {
    }

    ~Controller() { cancel_followup(); }

    Controller(const Controller &) = delete;
    Controller &operator=(const Controller &) = delete;

    // A changed list restarts polling when it is running.
    void set_machines(std::vector<Machine> machines)
    {
        machines_ = std::move(machines);
        if (fleet_.running())
            fleet_.start(machines_, fleet_.interval());
    }

    const std::vector<Machine> &machines() const { return machines_; }

    // Matches id first, then exact name, like MachineStore::find.
    std::optional<Machine> find(const std::string &id_or_name) const
    {
        auto it = std::find_if(machines_.begin(), machines_.end(),
                               [&](const Machine &m) { return m.id == id_or_name; });
        if (it == machines_.end())
            it = std::find_if(machines_.begin(), machines_.end(),
                              [&](const Machine &m) { return m.name == id_or_name; });
        if (it == machines_.end())
            return std::nullopt;
        return *it;
    }

    void start_polling() { fleet_.start(machines_, settings_.status_interval); }
    void start_polling(std::chrono::seconds interval) { fleet_.start(machines_, interval); }
    void stop_polling() { fleet_.stop(); }

    // Manual refresh: one pass now, and the timer restarts so it does not double-check.
    void refresh(FleetStatusPoller::Done done = {})
    {
        fleet_.check_all(machines_, std::move(done));
        if (fleet_.running())
            fleet_.reset(machines_, fleet_.pending_interval().value_or(fleet_.interval()));
    }

    void set_interval(std::chrono::seconds interval)
    {
        if (!is_supported_interval(interval.count()))
            throw std::invalid_argument("unsupported status interval " + std::to_string(interval.count()) + "s");
        fleet_.set_pending_interval(interval);
    }

    bool wake(const std::string &id_or_name, WakeOrchestrator::Completion done = {})
    {
        auto m = find(id_or_name);
        if (!m)
            return false;
        wake(*m, std::move(done));
        return true;
    }

    // On success the machine is marked online, then re-checked after a settle delay;
    // on timeout it is re-checked sooner.
    void wake(const Machine &machine, WakeOrchestrator::Completion done = {})
    {
        cancel_followup();
        const Machine snapshot = machine;
        wake_.wake(snapshot, [this, snapshot, done](WakeOutcome outcome)
                   {
            if (outcome == WakeOutcome::Success)
            {
                fleet_.record(snapshot.id, true);
                schedule_followup(snapshot, settings_.verify_after_success);
            }
            else
            {
                schedule_followup(snapshot, settings_.verify_after_timeout);
            }
            if (done)
                done(outcome); });
    }

    bool cancel_wake() { return wake_.cancel(); }

    WakeOrchestrator &wake_session() { return wake_; }
    const WakeOrchestrator &wake_session() const { return wake_; }
    FleetStatusPoller &fleet() { return fleet_; }
    const FleetStatusPoller &fleet() const { return fleet_; }

private:
    void schedule_followup(const Machine &machine, std::chrono::milliseconds delay)
    {
        followup_ = scheduler_.schedule_after(delay, [this, machine]
                                              {
            followup_.reset();
            fleet_.check_machine(machine, [name = machine.name](bool ok)
                                 { log::info("wake", "final status check for " + name + ": " + (ok ? "Online" : "Offline")); }); });
    }

    void cancel_followup()
    {
        if (followup_)
            scheduler_.cancel(*followup_);
        followup_.reset();
    }

    Scheduler &scheduler_;
    const Settings &settings_;
    std::vector<Machine> machines_;
    WakeOrchestrator wake_;
    FleetStatusPoller fleet_;
    std::optional<Scheduler::TaskId> followup_;
};

} // namespace lanwake
