/*
 * File: include/lanwake/prober.hpp
 * Project: LanWake
 * Purpose: Reachability probe: bare TCP connect to ip:port with a deadline
 * Notes:
 *  - See DESIGN.md
 *  - Connect runs on the worker io_context; the verdict is posted to the control Scheduler
 *  - Exactly one verdict per probe; later transitions are ignored
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "lanwake/log.hpp"
#include "lanwake/scheduler.hpp"

namespace lanwake
{

class ProbeHandle
{
public:
    virtual ~ProbeHandle() = default;
    // Abandons the attempt; the callback still fires once, with false.
    virtual void cancel() = 0;
};

using ProbeHandlePtr = std::shared_ptr<ProbeHandle>;

class ReachabilityProber
{
public:
    using Callback = std::function<void(bool reachable)>;

    virtual ~ReachabilityProber() = default;

    virtual ProbeHandlePtr probe(const std::string &host, int port,
                                 std::chrono::milliseconds timeout, Callback done) = 0;
};

class TcpProbeAttempt : public ProbeHandle, public std::enable_shared_from_this<TcpProbeAttempt>
{
public:
    using tcp = boost::asio::ip::tcp;

    TcpProbeAttempt(boost::asio::io_context &worker, Scheduler &control, ReachabilityProber::Callback done)
        : strand_(boost::asio::make_strand(worker)),
          socket_(strand_),
          deadline_(strand_),
          control_(control),
          done_(std::move(done))
    {
    }

    void start(const std::string &host, int port, std::chrono::milliseconds timeout)
    {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self, host, port, timeout]
                              {
            if (port <= 0 || port > 65535)
            {
                log::warn("probe", "invalid port " + std::to_string(port) + " for " + host);
                return self->finish(false);
            }
            // dotted quads only; names are never resolved
            boost::system::error_code ec;
            const auto address = boost::asio::ip::make_address_v4(host, ec);
            if (ec)
            {
                log::warn("probe", "not an IPv4 address: " + host);
                return self->finish(false);
            }
            self->deadline_.expires_after(timeout);
            self->deadline_.async_wait([self, host, port](const boost::system::error_code &ec)
                                       {
                if (ec)
                    return;
                log::debug("probe", host + ":" + std::to_string(port) + " timed out");
                self->finish(false); });

            self->socket_.async_connect(tcp::endpoint(address, static_cast<unsigned short>(port)),
                                        [self](const boost::system::error_code &ec)
                                        { self->finish(!ec); }); });
    }

    void cancel() override
    {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self]
                              { self->finish(false); });
    }

private:
    // strand only
    void finish(bool reachable)
    {
        if (resolved_)
            return;
        resolved_ = true;
        boost::system::error_code ignored;
        deadline_.cancel();
        socket_.close(ignored);
        control_.post([done = std::move(done_), reachable]
                      {
            if (done)
                done(reachable); });
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    boost::asio::steady_timer deadline_;
    Scheduler &control_;
    ReachabilityProber::Callback done_;
    bool resolved_ = false;
};

class TcpProber : public ReachabilityProber
{
public:
    TcpProber(boost::asio::io_context &worker, Scheduler &control)
        : worker_(worker), control_(control) {}

    ProbeHandlePtr probe(const std::string &host, int port,
                         std::chrono::milliseconds timeout, Callback done) override
    {
        auto attempt = std::make_shared<TcpProbeAttempt>(worker_, control_, std::move(done));
        attempt->start(host, port, timeout);
        return attempt;
    }

private:
    boost::asio::io_context &worker_;
    Scheduler &control_;
};

} // namespace lanwake
