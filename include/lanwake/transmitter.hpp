/*
 * File: include/lanwake/transmitter.hpp
 * Project: LanWake
 * Purpose: Magic packet transmission over UDP broadcast with fallbacks
 * Notes:
 *  - See DESIGN.md
 *  - Fire-and-forget: WoL has no receipt, send() reports nothing to the caller
 *  - Primary path is a blocking BSD socket bounded by SO_SNDTIMEO, run on the worker
 * Last updated: 2026-10-18
 */

#pragma once
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <boost/asio.hpp>
#include "lanwake/log.hpp"
#include "lanwake/mac_codec.hpp"
#include "lanwake/settings.hpp"

namespace lanwake
{

constexpr const char *kUniversalBroadcast = "255.255.255.255";

struct SendOutcome
{
    boost::system::error_code ec;
    std::size_t bytes = 0;
};

// Datagram seam between the WoL algorithm and real sockets.
class DatagramSender
{
public:
    virtual ~DatagramSender() = default;

    virtual SendOutcome send_broadcast(const MagicPacket &packet, const std::string &host, std::uint16_t port) = 0;

    // Best effort; the outcome is only logged.
    virtual void send_async(const MagicPacket &packet, const std::string &host, std::uint16_t port) = 0;
};

class MagicPacketSender
{
public:
    virtual ~MagicPacketSender() = default;
    virtual void send(const std::string &mac_address, const std::string &broadcast_address, std::uint16_t port) = 0;
};

class UdpDatagramSender : public DatagramSender
{
public:
    UdpDatagramSender(boost::asio::io_context &worker, std::chrono::milliseconds send_timeout)
        : worker_(worker), send_timeout_(send_timeout) {}

    SendOutcome send_broadcast(const MagicPacket &packet, const std::string &host, std::uint16_t port) override
    {
        SendOutcome out;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
        {
            out.ec = boost::asio::error::make_error_code(boost::asio::error::invalid_argument);
            return out;
        }

        int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        if (fd < 0)
        {
            out.ec = boost::system::error_code(errno, boost::system::system_category());
            return out;
        }

        int broadcast = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0)
        {
            out.ec = boost::system::error_code(errno, boost::system::system_category());
            ::close(fd);
            return out;
        }

        auto us = std::chrono::duration_cast<std::chrono::microseconds>(send_timeout_).count();
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(us / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(us % 1000000);
        if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0)
            log::warn("wol", "could not set send timeout: " +
                                 boost::system::error_code(errno, boost::system::system_category()).message());

        ssize_t n = ::sendto(fd, packet.data(), packet.size(), 0,
                             reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        if (n < 0)
            out.ec = boost::system::error_code(errno, boost::system::system_category());
        else
            out.bytes = static_cast<std::size_t>(n);
        ::close(fd);
        return out;
    }

    void send_async(const MagicPacket &packet, const std::string &host, std::uint16_t port) override
    {
        using boost::asio::ip::udp;
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address_v4(host, ec);
        if (ec)
        {
            log::error("wol", "invalid IP address: " + host);
            return;
        }
        auto sock = std::make_shared<udp::socket>(worker_);
        sock->open(udp::v4(), ec);
        if (!ec)
            sock->set_option(boost::asio::socket_base::broadcast(true), ec);
        if (ec)
        {
            log::error("wol", "async socket setup failed: " + ec.message());
            return;
        }
        auto buf = std::make_shared<MagicPacket>(packet);
        const std::string where = host + ":" + std::to_string(port);
        sock->async_send_to(boost::asio::buffer(*buf), udp::endpoint(address, port),
                            [sock, buf, where](const boost::system::error_code &ec, std::size_t n)
                            {
            if (ec)
                log::error("wol", "async send to " + where + " failed: " + ec.message());
            else
                log::info("wol", "magic packet sent via async path (" + std::to_string(n) + " bytes to " + where + ")");
            boost::system::error_code ignored;
            sock->close(ignored); });
    }

private:
    boost::asio::io_context &worker_;
    std::chrono::milliseconds send_timeout_;
};

class PacketTransmitter : public MagicPacketSender
{
public:
    PacketTransmitter(DatagramSender &sender, const Settings &settings)
        : sender_(sender), settings_(settings) {}

    void send(const std::string &mac_address, const std::string &broadcast_address, std::uint16_t port) override
    {
        const std::string where = broadcast_address + ":" + std::to_string(port);
        log::info("wol", "=== Wake-on-LAN === target " + mac_address + " via " + where);

        auto mac = parse_mac(mac_address);
        if (!mac)
        {
            log::error("wol", "Invalid MAC address format: " + mac.reason);
            return;
        }
        const MagicPacket packet = build_magic_packet(mac.bytes);
        log::debug("wol", "packet size " + std::to_string(packet.size()) + " bytes");

        if (!send_checked("primary", packet, broadcast_address, port))
            send_checked("fallback", packet, kUniversalBroadcast, port);

        if (settings_.secondary_broadcast)
        {
            log::info("wol", "secondary: async universal broadcast");
            sender_.send_async(packet, kUniversalBroadcast, port);
        }
    }

    void send(const std::string &mac_address, const std::string &broadcast_address)
    {
        send(mac_address, broadcast_address, settings_.wol_port);
    }

private:
    bool send_checked(const char *stage, const MagicPacket &packet, const std::string &host, std::uint16_t port)
    {
        const std::string where = host + ":" + std::to_string(port);
        auto r = sender_.send_broadcast(packet, host, port);
        if (r.ec)
        {
            log::warn("wol", std::string(stage) + " send to " + where + " failed: " + r.ec.message());
            return false;
        }
        if (r.bytes != packet.size())
        {
            log::warn("wol", std::string(stage) + " send to " + where + " wrote " + std::to_string(r.bytes) +
                                 " bytes (expected " + std::to_string(packet.size()) + ")");
            return false;
        }
        log::info("wol", std::string(stage) + " sent " + std::to_string(r.bytes) + " bytes to " + where);
        return true;
    }

    DatagramSender &sender_;
    const Settings &settings_;
};

// Moves the blocking send off the control thread.
class BackgroundTransmitter : public MagicPacketSender
{
public:
    BackgroundTransmitter(boost::asio::io_context &worker, MagicPacketSender &inner)
        : worker_(worker), inner_(inner) {}

    void send(const std::string &mac_address, const std::string &broadcast_address, std::uint16_t port) override
    {
        boost::asio::post(worker_, [&inner = inner_, mac_address, broadcast_address, port]
                          { inner.send(mac_address, broadcast_address, port); });
    }

private:
    boost::asio::io_context &worker_;
    MagicPacketSender &inner_;
};

} // namespace lanwake
