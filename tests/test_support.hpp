/*
 * File: tests/test_support.hpp
 * Project: LanWake
 * Purpose: Fake clock scheduler, scripted prober and recording senders for tests
 * Notes:
 *  - See DESIGN.md
 *  - Virtual time only moves in advance(); nothing here sleeps
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "lanwake/machine.hpp"
#include "lanwake/prober.hpp"
#include "lanwake/scheduler.hpp"
#include "lanwake/transmitter.hpp"

namespace lanwake::test
{

using namespace std::chrono_literals;

class ManualScheduler : public Scheduler
{
public:
    TimePoint now() const override { return now_; }

    WallTime wall_now() const override
    {
        return WallTime(std::chrono::seconds(1'760'000'000)) +
               std::chrono::duration_cast<std::chrono::system_clock::duration>(now_.time_since_epoch());
    }

    void post(Task task) override { posted_.push_back(std::move(task)); }

    TaskId schedule_after(Duration delay, Task task) override
    {
        const TaskId id = next_id_++;
        timers_.emplace(id, Entry{now_ + delay, std::move(task)});
        return id;
    }

    bool cancel(TaskId id) override { return timers_.erase(id) != 0; }

    // Runs everything due up to now + d, in deadline order, moving the clock as it goes.
    void advance(Duration d)
    {
        const TimePoint target = now_ + d;
        for (;;)
        {
            drain_posted();
            auto it = next_due(target);
            if (it == timers_.end())
                break;
            if (it->second.due > now_)
                now_ = it->second.due;
            auto task = std::move(it->second.task);
            timers_.erase(it);
            task();
        }
        now_ = target;
        drain_posted();
    }

    void run_ready() { advance(Duration::zero()); }

    std::size_t pending_timers() const { return timers_.size(); }
    Duration elapsed() const { return now_.time_since_epoch(); }

private:
    struct Entry
    {
        TimePoint due;
        Task task;
    };

    void drain_posted()
    {
        while (!posted_.empty())
        {
            auto t = std::move(posted_.front());
            posted_.pop_front();
            t();
        }
    }

    // ids grow monotonically, so equal deadlines run in scheduling order
    std::map<TaskId, Entry>::iterator next_due(TimePoint limit)
    {
        auto best = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it)
        {
            if (it->second.due > limit)
                continue;
            if (best == timers_.end() || it->second.due < best->second.due)
                best = it;
        }
        return best;
    }

    TimePoint now_{};
    std::deque<Task> posted_;
    std::map<TaskId, Entry> timers_;
    TaskId next_id_ = 1;
};

// Answers from a script (then a per-host default), after `latency` of virtual time.
// With hold = true nothing is answered until resolve() is called.
class FakeProber : public ReachabilityProber
{
public:
    struct Call : ProbeHandle, std::enable_shared_from_this<Call>
    {
        std::string host;
        int port = 0;
        std::chrono::milliseconds timeout{0};
        Callback done;
        bool resolved = false;
        bool cancelled = false;
        Scheduler *sched = nullptr;

        void finish(bool r)
        {
            if (resolved)
                return;
            resolved = true;
            auto d = std::move(done);
            if (d)
                d(r);
        }

        void cancel() override
        {
            cancelled = true;
            if (resolved)
                return;
            auto self = shared_from_this();
            sched->post([self]
                        { self->finish(false); });
        }
    };

    explicit FakeProber(ManualScheduler &sched) : sched_(sched) {}

    ProbeHandlePtr probe(const std::string &host, int port, std::chrono::milliseconds timeout, Callback done) override
    {
        auto call = std::make_shared<Call>();
        call->host = host;
        call->port = port;
        call->timeout = timeout;
        call->done = std::move(done);
        call->sched = &sched_;
        calls.push_back(call);
        if (!hold)
        {
            bool answer = default_answer;
            auto h = reachable.find(host);
            if (h != reachable.end())
                answer = h->second;
            if (!script.empty())
            {
                answer = script.front();
                script.pop_front();
            }
            sched_.schedule_after(latency, [call, answer]
                                  { call->finish(answer); });
        }
        return call;
    }

    void resolve(std::size_t index, bool reachable_now)
    {
        auto call = calls.at(index);
        sched_.post([call, reachable_now]
                    { call->finish(reachable_now); });
    }

    std::size_t count_for(const std::string &host) const
    {
        std::size_t n = 0;
        for (const auto &c : calls)
            if (c->host == host)
                ++n;
        return n;
    }

    std::vector<std::shared_ptr<Call>> calls;
    std::deque<bool> script;
    std::map<std::string, bool> reachable;
    bool default_answer = false;
    bool hold = false;
    Scheduler::Duration latency = Scheduler::Duration::zero();

private:
    ManualScheduler &sched_;
};

struct SentPacket
{
    std::string mac;
    std::string broadcast;
    std::uint16_t port = 0;
};

class RecordingPacketSender : public MagicPacketSender
{
public:
    void send(const std::string &mac, const std::string &broadcast, std::uint16_t port) override
    {
        sent.push_back({mac, broadcast, port});
    }
    std::vector<SentPacket> sent;
};

class FakeDatagramSender : public DatagramSender
{
public:
    struct Datagram
    {
        MagicPacket packet;
        std::string host;
        std::uint16_t port;
        bool async;
    };

    SendOutcome send_broadcast(const MagicPacket &packet, const std::string &host, std::uint16_t port) override
    {
        sent.push_back({packet, host, port, false});
        auto it = outcomes.find(host);
        if (it != outcomes.end())
            return it->second;
        return SendOutcome{{}, packet.size()};
    }

    void send_async(const MagicPacket &packet, const std::string &host, std::uint16_t port) override
    {
        sent.push_back({packet, host, port, true});
    }

    std::vector<Datagram> sent;
    std::map<std::string, SendOutcome> outcomes;
};

inline Machine make_machine(const std::string &id, const std::string &name, const std::string &ip,
                            const std::string &mac = "AA:BB:CC:DD:EE:FF", int port = 22)
{
    Machine m;
    m.id = id;
    m.name = name;
    m.mac_address = mac;
    m.ipv4_address = ip;
    m.mask = "255.255.255.0";
    m.broadcast_address = calculate_broadcast(ip, m.mask).value_or("");
    m.ping_port = port;
    return m;
}

} // namespace lanwake::test
