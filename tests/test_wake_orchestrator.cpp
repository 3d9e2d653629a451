/*
 * File: tests/test_wake_orchestrator.cpp
 * Project: LanWake
 * Purpose: Wake session state machine under a virtual clock
 * Notes:
 *  - See DESIGN.md
 *  - Default timings: 1s initial delay, 2s cadence, 30 attempts
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <algorithm>
#include "lanwake/wake_orchestrator.hpp"
#include "test_support.hpp"

using namespace lanwake;
using namespace std::chrono_literals;

namespace
{
struct Rig
{
    Settings settings;
    test::ManualScheduler sched;
    test::FakeProber prober{sched};
    test::RecordingPacketSender packets;
    WakeOrchestrator wake{sched, packets, prober, settings};
    Machine pc = test::make_machine("pc-1", "desktop", "192.168.1.50");
    std::vector<WakeOutcome> outcomes;

    void start()
    {
        wake.wake(pc, [this](WakeOutcome o)
                  { outcomes.push_back(o); });
    }
};
} // namespace

TEST_CASE("unreachable machine times out after exactly 30 attempts at 61s")
{
    Rig r;
    log::ScopedCapture cap;
    r.start();
    REQUIRE(r.wake.snapshot().state == WakeState::Sending);

    r.sched.advance(1s);
    REQUIRE(r.wake.snapshot().state == WakeState::Waiting);
    REQUIRE(r.wake.snapshot().status_message == "Waiting for machine to respond... (Attempt 1/30)");
    REQUIRE(r.prober.calls.empty());

    r.sched.advance(59s);
    REQUIRE(r.wake.snapshot().state == WakeState::Waiting);
    REQUIRE(r.wake.snapshot().attempts == 29);
    REQUIRE(r.outcomes.empty());

    r.sched.advance(1s);
    REQUIRE(r.wake.snapshot().state == WakeState::TimedOut);
    REQUIRE(r.wake.snapshot().attempts == 30);
    REQUIRE(r.prober.calls.size() == 30);
    REQUIRE(r.wake.snapshot().status_message == "Timeout: Machine did not respond within 61 seconds");
    REQUIRE(r.outcomes == std::vector<WakeOutcome>{WakeOutcome::TimedOut});
    REQUIRE(r.sched.elapsed() == 61s);
    REQUIRE(cap.contains("wake process result for desktop: FAILED after 30 attempts"));

    r.sched.advance(100s);
    REQUIRE(r.prober.calls.size() == 30);
    REQUIRE(r.outcomes.size() == 1);
}

TEST_CASE("wake probes use the machine port and the wake probe timeout")
{
    Rig r;
    r.pc.ping_port = 3389;
    r.start();
    r.sched.advance(3s);
    REQUIRE(r.prober.calls.size() == 1);
    REQUIRE(r.prober.calls[0]->host == "192.168.1.50");
    REQUIRE(r.prober.calls[0]->port == 3389);
    REQUIRE(r.prober.calls[0]->timeout == 5000ms);
}

TEST_CASE("magic packet is sent once with the machine broadcast on port 9")
{
    Rig r;
    r.start();
    REQUIRE(r.packets.sent.size() == 1);
    REQUIRE(r.packets.sent[0].mac == "AA:BB:CC:DD:EE:FF");
    REQUIRE(r.packets.sent[0].broadcast == "192.168.1.255");
    REQUIRE(r.packets.sent[0].port == 9);
    r.sched.advance(70s);
    REQUIRE(r.packets.sent.size() == 1);
}

TEST_CASE("first reachable probe ends the session with success")
{
    Rig r;
    log::ScopedCapture cap;
    r.prober.script = {false, false, true};
    r.start();
    r.sched.advance(7s);

    const auto &s = r.wake.snapshot();
    REQUIRE(s.state == WakeState::Success);
    REQUIRE(s.reachable);
    REQUIRE(s.attempts == 3);
    REQUIRE(s.status_message == "Success! Machine is now live");
    REQUIRE(r.outcomes == std::vector<WakeOutcome>{WakeOutcome::Success});
    REQUIRE_FALSE(r.wake.can_cancel());
    REQUIRE(cap.contains("SUCCESS after 3 attempts"));

    r.sched.advance(60s);
    REQUIRE(r.prober.calls.size() == 3);
}

TEST_CASE("slow probes never overlap and the next one follows the late result")
{
    Rig r;
    r.prober.hold = true;
    r.start();
    r.sched.advance(3s);
    REQUIRE(r.prober.calls.size() == 1);

    r.sched.advance(10s);
    REQUIRE(r.prober.calls.size() == 1);
    REQUIRE(r.wake.snapshot().attempts == 1);

    r.prober.resolve(0, false);
    r.sched.run_ready();
    REQUIRE(r.prober.calls.size() == 2);
    REQUIRE(r.wake.snapshot().attempts == 2);
    REQUIRE(r.wake.snapshot().status_message == "Pinging... (Attempt 2/30)");
}

TEST_CASE("cancel stops the cadence without a completion")
{
    Rig r;
    REQUIRE_FALSE(r.wake.cancel());

    r.prober.hold = true;
    r.start();
    REQUIRE(r.wake.can_cancel());

    SECTION("while sending")
    {
        REQUIRE(r.wake.cancel());
        r.sched.advance(100s);
        REQUIRE(r.prober.calls.empty());
    }
    SECTION("while a probe is in flight")
    {
        r.sched.advance(3s);
        REQUIRE(r.wake.cancel());
        REQUIRE(r.prober.calls[0]->cancelled);
        r.prober.resolve(0, true);
        r.sched.advance(100s);
        REQUIRE(r.prober.calls.size() == 1);
        REQUIRE_FALSE(r.wake.snapshot().reachable);
    }

    REQUIRE(r.wake.snapshot().state == WakeState::Cancelled);
    REQUIRE(r.wake.snapshot().status_message == "Cancelled");
    REQUIRE(r.outcomes.empty());
    REQUIRE_FALSE(r.wake.cancel());
    REQUIRE(r.wake.snapshot().state == WakeState::Cancelled);
}

TEST_CASE("cancel is refused once the last attempt is running")
{
    Rig r;
    r.settings.wake_max_attempts = 2;
    r.prober.hold = true;
    r.start();
    r.sched.advance(3s);
    r.prober.resolve(0, false);
    r.sched.run_ready();
    r.sched.advance(2s);
    REQUIRE(r.wake.snapshot().attempts == 2);
    REQUIRE(r.wake.snapshot().state == WakeState::Waiting);
    REQUIRE_FALSE(r.wake.can_cancel());
    REQUIRE_FALSE(r.wake.cancel());

    r.prober.resolve(1, false);
    r.sched.run_ready();
    REQUIRE(r.wake.snapshot().state == WakeState::TimedOut);
    REQUIRE(r.wake.snapshot().status_message == "Timeout: Machine did not respond within 5 seconds");
}

TEST_CASE("cancel after a terminal state changes nothing")
{
    Rig r;
    SECTION("timed out")
    {
        r.start();
        r.sched.advance(61s);
        REQUIRE(r.wake.snapshot().state == WakeState::TimedOut);
        REQUIRE_FALSE(r.wake.cancel());
        REQUIRE(r.wake.snapshot().state == WakeState::TimedOut);
        REQUIRE(r.outcomes == std::vector<WakeOutcome>{WakeOutcome::TimedOut});
    }
    SECTION("success")
    {
        r.prober.script = {true};
        r.start();
        r.sched.advance(3s);
        REQUIRE(r.wake.snapshot().state == WakeState::Success);
        REQUIRE_FALSE(r.wake.cancel());
        REQUIRE(r.wake.snapshot().state == WakeState::Success);
        REQUIRE(r.wake.snapshot().status_message == "Success! Machine is now live");
        REQUIRE(r.outcomes == std::vector<WakeOutcome>{WakeOutcome::Success});
    }
    r.sched.advance(30s);
    REQUIRE(r.outcomes.size() == 1);
}

TEST_CASE("a new wake abandons the previous session")
{
    Rig r;
    r.prober.hold = true;
    r.start();
    r.sched.advance(3s);
    REQUIRE(r.prober.calls.size() == 1);

    auto other = test::make_machine("pc-2", "laptop", "192.168.1.60");
    int other_done = 0;
    r.wake.wake(other, [&](WakeOutcome)
                { ++other_done; });
    REQUIRE(r.prober.calls[0]->cancelled);
    r.prober.resolve(0, true);
    r.sched.run_ready();

    REQUIRE(r.wake.snapshot().machine_id == "pc-2");
    REQUIRE(r.wake.snapshot().state == WakeState::Sending);
    REQUIRE_FALSE(r.wake.snapshot().reachable);
    REQUIRE(r.outcomes.empty());

    r.sched.advance(3s);
    REQUIRE(r.prober.calls.back()->host == "192.168.1.60");
    r.prober.resolve(r.prober.calls.size() - 1, true);
    r.sched.run_ready();
    REQUIRE(other_done == 1);
}

TEST_CASE("listeners see every transition in order")
{
    Rig r;
    std::vector<WakeState> states;
    std::vector<std::string> messages;
    int id = r.wake.subscribe([&](const WakeSnapshot &s)
                              {
        states.push_back(s.state);
        messages.push_back(s.status_message); });
    r.prober.script = {false, true};
    r.start();
    r.sched.advance(10s);

    REQUIRE(states.front() == WakeState::Sending);
    REQUIRE(states.back() == WakeState::Success);
    REQUIRE(std::find(messages.begin(), messages.end(), "Pinging... (Attempt 1/30)") != messages.end());
    REQUIRE(std::find(messages.begin(), messages.end(), "Waiting for response... (Attempt 1/30)") != messages.end());

    r.wake.unsubscribe(id);
    const auto seen = states.size();
    r.start();
    REQUIRE(states.size() == seen);
}

TEST_CASE("target keeps the record the session started with")
{
    Rig r;
    r.prober.hold = true;
    r.start();
    r.pc.ipv4_address = "192.168.1.99";
    r.sched.advance(3s);
    REQUIRE(r.wake.target()->ipv4_address == "192.168.1.50");
    REQUIRE(r.prober.calls[0]->host == "192.168.1.50");
}
