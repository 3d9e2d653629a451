/*
 * File: src/lanwake_http.hpp
 * Project: LanWake
 * Purpose: HTTP routing and handlers for the serve session
 * Notes:
 *  - See DESIGN.md
 *  - One request per connection; handlers run on the control thread
 *  - Wake requests are serialized here: the core does not lock sessions
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "lanwake_state.hpp"

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

inline HttpResponse json_response(http::status status, unsigned version, const nlohmann::json &body)
{
    HttpResponse res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

inline HttpResponse handle_request(SessionState &state, const HttpRequest &req)
{
    using nlohmann::json;
    const auto v = req.version();
    const std::string target(req.target());
    auto &ctl = *state.controller;

    // GET /health
    if (req.method() == http::verb::get && target == "/health")
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
        return json_response(http::status::ok, v, json{{"status", "ok"}, {"uptime_s", up}});
    }

    // GET /v1/config
    if (req.method() == http::verb::get && target == "/v1/config")
        return json_response(http::status::ok, v, lanwake::settings_to_json(*state.settings));

    // GET /v1/machines
    if (req.method() == http::verb::get && target == "/v1/machines")
    {
        json out = json::array();
        for (const auto &m : ctl.machines())
        {
            json jm = lanwake::machine_to_json(m);
            jm["problems"] = lanwake::validate_machine(m);
            out.push_back(jm);
        }
        return json_response(http::status::ok, v, out);
    }

    // GET /v1/status
    if (req.method() == http::verb::get && target == "/v1/status")
        return json_response(http::status::ok, v, fleet_to_json(ctl));

    // POST /v1/status/refresh
    if (req.method() == http::verb::post && target == "/v1/status/refresh")
    {
        ctl.refresh();
        return json_response(http::status::accepted, v, json{{"status", "refreshing"}, {"machines", ctl.machines().size()}});
    }

    // POST /v1/status/interval  Body: {"interval_s": 60}
    if (req.method() == http::verb::post && target == "/v1/status/interval")
    {
        try
        {
            auto body = json::parse(req.body());
            if (!body.contains("interval_s") || !body["interval_s"].is_number_integer())
                return json_response(http::status::bad_request, v, json{{"error", "missing fields"}, {"required", json::array({"interval_s"})}});
            ctl.set_interval(std::chrono::seconds(body["interval_s"].get<long>()));
            return json_response(http::status::ok, v, json{{"status", "ok"}, {"pending_interval_s", body["interval_s"]}});
        }
        catch (const std::exception &e)
        {
            return json_response(http::status::bad_request, v, json{{"error", "bad interval"}, {"what", e.what()}});
        }
    }

    // GET /v1/wake
    if (req.method() == http::verb::get && target == "/v1/wake")
    {
        const auto &w = ctl.wake_session();
        return json_response(http::status::ok, v, wake_to_json(w.snapshot(), w.can_cancel()));
    }

    // POST /v1/wake  Body: {"id": "<machine id or name>"}
    if (req.method() == http::verb::post && target == "/v1/wake")
    {
        try
        {
            auto body = json::parse(req.body());
            const std::string id = body.value("id", std::string());
            if (id.empty())
                return json_response(http::status::bad_request, v, json{{"error", "missing fields"}, {"required", json::array({"id"})}});
            auto &w = ctl.wake_session();
            if (w.snapshot().active())
                return json_response(http::status::conflict, v,
                                     json{{"error", "wake in progress"}, {"session", wake_to_json(w.snapshot(), w.can_cancel())}});
            if (!ctl.wake(id))
                return json_response(http::status::not_found, v, json{{"error", "unknown machine"}, {"id", id}});
            return json_response(http::status::accepted, v, wake_to_json(w.snapshot(), w.can_cancel()));
        }
        catch (const std::exception &e)
        {
            return json_response(http::status::bad_request, v, json{{"error", "bad json"}, {"what", e.what()}});
        }
    }

    // POST /v1/wake/cancel
    if (req.method() == http::verb::post && target == "/v1/wake/cancel")
    {
        const bool cancelled = ctl.cancel_wake();
        const auto &w = ctl.wake_session();
        return json_response(http::status::ok, v, json{{"cancelled", cancelled}, {"session", wake_to_json(w.snapshot(), w.can_cancel())}});
    }

    // 404 fallback
    return json_response(http::status::not_found, v, json{{"error", "not found"}});
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    SessionState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, SessionState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    void close()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec) std::make_shared<Session>(std::move(socket_), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        HttpRequest req;
        SessionState &state;

        Session(boost::asio::ip::tcp::socket &&s, SessionState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](auto ec, auto)
                             {
                if (!ec) self->respond(handle_request(self->state, self->req)); });
        }

        // keep response alive through async_write
        void respond(HttpResponse &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<HttpResponse>(std::move(res));
            sp->set(http::field::server, "lanwake-beast");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }
    };
};
