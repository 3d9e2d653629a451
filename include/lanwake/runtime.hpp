/*
 * File: include/lanwake/runtime.hpp
 * Project: LanWake
 * Purpose: Production wiring: control io_context scheduler plus a background I/O worker
 * Notes:
 *  - See DESIGN.md
 *  - Socket connects and UDP sends run on the worker; verdicts come back via Scheduler::post
 * Last updated: 2026-10-18
 */

#pragma once
#include <thread>
#include <boost/asio.hpp>
#include "lanwake/log.hpp"
#include "lanwake/prober.hpp"
#include "lanwake/scheduler.hpp"
#include "lanwake/settings.hpp"
#include "lanwake/transmitter.hpp"

namespace lanwake
{

class Runtime
{
public:
    Runtime(boost::asio::io_context &control, const Settings &settings)
        : work_(boost::asio::make_work_guard(worker_)),
          scheduler_(control),
          datagrams_(worker_, settings.send_timeout),
          packets_(datagrams_, settings),
          transmitter_(worker_, packets_),
          prober_(worker_, scheduler_)
    {
        thread_ = std::thread([this]
                              {
            try
            {
                worker_.run();
            }
            catch (const std::exception &e)
            {
                log::error("runtime", std::string("worker stopped: ") + e.what());
            } });
    }

    ~Runtime()
    {
        worker_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Lets queued sends and abandoned probes drain, then joins the worker.
    void drain()
    {
        work_.reset();
        if (thread_.joinable())
            thread_.join();
    }

    Scheduler &scheduler() { return scheduler_; }
    MagicPacketSender &transmitter() { return transmitter_; }
    PacketTransmitter &packets() { return packets_; }
    ReachabilityProber &prober() { return prober_; }
    boost::asio::io_context &worker() { return worker_; }

private:
    boost::asio::io_context worker_{1};
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    AsioScheduler scheduler_;
    UdpDatagramSender datagrams_;
    PacketTransmitter packets_;
    BackgroundTransmitter transmitter_;
    TcpProber prober_;
    std::thread thread_;
};

} // namespace lanwake
