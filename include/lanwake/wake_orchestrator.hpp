/*
 * File: include/lanwake/wake_orchestrator.hpp
 * Project: LanWake
 * Purpose: Wake-and-verify session: send packet, then bounded TCP probe cadence
 * Notes:
 *  - See DESIGN.md
 *  - Idle -> Sending -> Waiting(1..max) -> Success | TimedOut, Cancelled from Sending/Waiting
 *  - Attempts are strictly sequential; the next one starts one cadence after the
 *    previous one started, or as soon as it resolved if that took longer
 *  - Callers serialize wake requests per machine; a new wake() discards the old session
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "lanwake/log.hpp"
#include "lanwake/machine.hpp"
#include "lanwake/prober.hpp"
#include "lanwake/scheduler.hpp"
#include "lanwake/settings.hpp"
#include "lanwake/transmitter.hpp"

namespace lanwake
{

enum class WakeState
{
    Idle,
    Sending,
    Waiting,
    Success,
    TimedOut,
    Cancelled
};

inline const char *to_string(WakeState s)
{
    switch (s)
    {
    case WakeState::Idle:
        return "idle";
    case WakeState::Sending:
        return "sending";
    case WakeState::Waiting:
        return "waiting";
    case WakeState::Success:
        return "success";
    case WakeState::TimedOut:
        return "timed_out";
    case WakeState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

enum class WakeOutcome
{
    Success,
    TimedOut
};

struct WakeSnapshot
{
    WakeState state = WakeState::Idle;
    std::string machine_id;
    std::string machine_name;
    int attempts = 0;
    int max_attempts = 0;
    bool reachable = false;
    std::string status_message = "Idle";

    bool terminal() const
    {
        return state == WakeState::Success || state == WakeState::TimedOut || state == WakeState::Cancelled;
    }
    bool active() const { return state == WakeState::Sending || state == WakeState::Waiting; }
};

class WakeOrchestrator
{
public:
    using Completion = std::function<void(WakeOutcome)>;
    using Listener = std::function<void(const WakeSnapshot &)>;

    WakeOrchestrator(Scheduler &scheduler, MagicPacketSender &transmitter,
                     ReachabilityProber &prober, const Settings &settings)
        : scheduler_(scheduler), transmitter_(transmitter), prober_(prober), settings_(settings)
    {
    }

    ~WakeOrchestrator()
    {
        stop_cadence();
        abandon_probe();
    }

    WakeOrchestrator(const WakeOrchestrator &) = delete;
    WakeOrchestrator &operator=(const WakeOrchestrator &) = delete;

    // The machine record is copied; later edits do not affect this session.
    void wake(const Machine &machine, Completion done = {})
    {
        stop_cadence();
        abandon_probe();
        ++session_;
        target_ = machine;
        done_ = std::move(done);

        snap_ = WakeSnapshot{};
        snap_.machine_id = machine.id;
        snap_.machine_name = machine.name;
        snap_.max_attempts = settings_.wake_max_attempts;
        snap_.state = WakeState::Sending;
        snap_.status_message = "Sending magic packet...";
        publish();

        log::info("wake", "starting wake for " + machine.name + " (mac " + machine.mac_address + ", ip " +
                              machine.ipv4_address + ", port " + std::to_string(machine.ping_port) + ")");
        transmitter_.send(machine.mac_address, machine.broadcast_address, settings_.wol_port);

        const auto s = session_;
        pending_ = scheduler_.schedule_after(settings_.wake_initial_delay, [this, s]
                                             {
            pending_.reset();
            begin_waiting(s); });
    }

    // Only while the target is unreachable and attempts remain; no completion fires.
    bool cancel()
    {
        if (!can_cancel())
            return false;
        stop_cadence();
        abandon_probe();
        done_ = {};
        snap_.state = WakeState::Cancelled;
        snap_.status_message = "Cancelled";
        log::info("wake", "wake for " + snap_.machine_name + " cancelled after " +
                              std::to_string(snap_.attempts) + " attempts");
        publish();
        return true;
    }

    bool can_cancel() const
    {
        return snap_.active() && !snap_.reachable && snap_.attempts < snap_.max_attempts;
    }

    const WakeSnapshot &snapshot() const { return snap_; }
    const std::optional<Machine> &target() const { return target_; }

    int subscribe(Listener l)
    {
        const int id = next_listener_++;
        listeners_.emplace(id, std::move(l));
        return id;
    }

    void unsubscribe(int id) { listeners_.erase(id); }

private:
    bool current(std::uint64_t s) const { return s == session_ && snap_.active(); }

    void begin_waiting(std::uint64_t s)
    {
        if (!current(s))
            return;
        snap_.state = WakeState::Waiting;
        snap_.status_message = "Waiting for machine to respond... (Attempt 1/" + std::to_string(snap_.max_attempts) + ")";
        publish();
        tick_started_ = scheduler_.now();
        pending_ = scheduler_.schedule_after(settings_.wake_cadence, [this, s]
                                             {
            pending_.reset();
            run_attempt(s); });
    }

    void run_attempt(std::uint64_t s)
    {
        if (!current(s))
            return;
        ++snap_.attempts;
        tick_started_ = scheduler_.now();
        snap_.status_message = "Pinging... (Attempt " + progress() + ")";
        publish();

        probe_pending_ = true;
        std::weak_ptr<int> alive = lifetime_;
        auto handle = prober_.probe(target_->ipv4_address, target_->ping_port, settings_.wake_probe_timeout,
                                    [this, alive, s](bool reachable)
                                    {
                                        if (alive.expired())
                                            return;
                                        on_probe_result(s, reachable);
                                    });
        // a prober may answer before returning the handle
        if (probe_pending_ && current(s))
            in_flight_ = std::move(handle);
    }

    void on_probe_result(std::uint64_t s, bool reachable)
    {
        if (!current(s))
        {
            log::debug("wake", "discarding probe result for a finished session");
            return;
        }
        probe_pending_ = false;
        in_flight_.reset();

        if (reachable)
        {
            snap_.reachable = true;
            return finish(WakeState::Success, "Success! Machine is now live");
        }
        if (snap_.attempts >= snap_.max_attempts)
        {
            const auto bound = settings_.wake_initial_delay + settings_.wake_cadence * snap_.max_attempts;
            return finish(WakeState::TimedOut,
                          "Timeout: Machine did not respond within " +
                              std::to_string(std::chrono::duration_cast<std::chrono::seconds>(bound).count()) + " seconds");
        }

        snap_.status_message = "Waiting for response... (Attempt " + progress() + ")";
        publish();

        const auto due = tick_started_ + settings_.wake_cadence;
        const auto delay = std::max<Scheduler::Duration>(due - scheduler_.now(), Scheduler::Duration::zero());
        pending_ = scheduler_.schedule_after(delay, [this, s]
                                             {
            pending_.reset();
            run_attempt(s); });
    }

    void finish(WakeState terminal, const std::string &message)
    {
        stop_cadence();
        snap_.state = terminal;
        snap_.status_message = message;
        log::info("wake", "wake process result for " + snap_.machine_name + ": " +
                              (terminal == WakeState::Success ? "SUCCESS" : "FAILED") + " after " +
                              std::to_string(snap_.attempts) + " attempts");
        publish();
        auto done = std::move(done_);
        done_ = {};
        if (done)
            done(terminal == WakeState::Success ? WakeOutcome::Success : WakeOutcome::TimedOut);
    }

    void stop_cadence()
    {
        if (pending_)
            scheduler_.cancel(*pending_);
        pending_.reset();
    }

    void abandon_probe()
    {
        probe_pending_ = false;
        if (in_flight_)
            in_flight_->cancel();
        in_flight_.reset();
    }

    std::string progress() const
    {
        return std::to_string(snap_.attempts) + "/" + std::to_string(snap_.max_attempts);
    }

    void publish()
    {
        // copy: a listener may unsubscribe itself
        auto ls = listeners_;
        for (auto &kv : ls)
            kv.second(snap_);
    }

    Scheduler &scheduler_;
    MagicPacketSender &transmitter_;
    ReachabilityProber &prober_;
    const Settings &settings_;

    WakeSnapshot snap_;
    std::optional<Machine> target_;
    Completion done_;
    std::uint64_t session_ = 0;
    std::optional<Scheduler::TaskId> pending_;
    ProbeHandlePtr in_flight_;
    bool probe_pending_ = false;
    Scheduler::TimePoint tick_started_{};

    std::map<int, Listener> listeners_;
    int next_listener_ = 1;
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

} // namespace lanwake
