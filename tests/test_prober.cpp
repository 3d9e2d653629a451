/*
 * File: tests/test_prober.cpp
 * Project: LanWake
 * Purpose: TCP reachability probe and the asio scheduler on real sockets
 * Notes:
 *  - See DESIGN.md
 *  - Loopback only; ports come from the kernel
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <optional>
#include <boost/asio.hpp>
#include "lanwake/runtime.hpp"

using namespace lanwake;
using namespace std::chrono_literals;
using boost::asio::ip::tcp;

namespace
{
std::optional<bool> probe_once(boost::asio::io_context &control, Runtime &rt, const std::string &host, int port,
                               std::chrono::milliseconds timeout, int *calls = nullptr)
{
    std::optional<bool> verdict;
    auto guard = boost::asio::make_work_guard(control);
    rt.prober().probe(host, port, timeout, [&](bool r)
                      {
        verdict = r;
        if (calls)
            ++*calls;
        control.stop(); });
    control.run_for(5s);
    control.restart();
    return verdict;
}
} // namespace

TEST_CASE("listening port is reachable")
{
    boost::asio::io_context control;
    Settings settings;
    Runtime rt{control, settings};
    boost::asio::io_context other;
    tcp::acceptor listener{other, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};
    const int port = listener.local_endpoint().port();

    REQUIRE(probe_once(control, rt, "127.0.0.1", port, 2000ms) == std::optional<bool>(true));
}

TEST_CASE("closed port and bad input are unreachable")
{
    boost::asio::io_context control;
    Settings settings;
    Runtime rt{control, settings};

    int port = 0;
    {
        boost::asio::io_context other;
        tcp::acceptor tmp{other, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};
        port = tmp.local_endpoint().port();
    }
    REQUIRE(probe_once(control, rt, "127.0.0.1", port, 2000ms) == std::optional<bool>(false));
    REQUIRE(probe_once(control, rt, "127.0.0.1", 0, 2000ms) == std::optional<bool>(false));
    REQUIRE(probe_once(control, rt, "127.0.0.1", 70000, 2000ms) == std::optional<bool>(false));
}

TEST_CASE("host names are not resolved")
{
    boost::asio::io_context control;
    Settings settings;
    Runtime rt{control, settings};
    boost::asio::io_context other;
    tcp::acceptor listener{other, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};
    const int port = listener.local_endpoint().port();

    REQUIRE(probe_once(control, rt, "localhost", port, 2000ms) == std::optional<bool>(false));
    REQUIRE(probe_once(control, rt, "127.0.1", port, 2000ms) == std::optional<bool>(false));
    REQUIRE(probe_once(control, rt, "127.0.0.1", port, 2000ms) == std::optional<bool>(true));
}

TEST_CASE("cancelled probe reports false exactly once")
{
    boost::asio::io_context control;
    Settings settings;
    Runtime rt{control, settings};

    int calls = 0;
    std::optional<bool> verdict;
    auto guard = boost::asio::make_work_guard(control);
    // TEST-NET-1, never answers
    auto handle = rt.prober().probe("192.0.2.1", 9, 3000ms, [&](bool r)
                                    {
        verdict = r;
        ++calls; });
    handle->cancel();
    handle->cancel();
    control.run_for(500ms);

    REQUIRE(verdict == std::optional<bool>(false));
    REQUIRE(calls == 1);
}

TEST_CASE("asio scheduler skips cancelled tasks")
{
    boost::asio::io_context control;
    AsioScheduler sched{control};
    std::vector<int> ran;
    auto first = sched.schedule_after(10ms, [&]
                                      { ran.push_back(1); });
    sched.schedule_after(20ms, [&]
                         { ran.push_back(2); });
    sched.post([&]
               { ran.push_back(0); });
    REQUIRE(sched.cancel(first));
    REQUIRE_FALSE(sched.cancel(first));
    control.run_for(1s);
    REQUIRE(ran == std::vector<int>{0, 2});
}
