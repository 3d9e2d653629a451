#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "lanwake/log.hpp"
#include "lanwake_state.hpp"

namespace websocket = boost::beast::websocket;

// Push feed: every fleet / wake change goes out as {"topic": ..., "payload": ...}.
// Clients only listen; anything they send is discarded.
class WsServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    SessionState &state_;

public:
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, SessionState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    void publish(const std::string &topic, const nlohmann::json &payload)
    {
        broadcast(nlohmann::json{{"topic", topic}, {"payload", payload}}.dump());
    }

    void broadcast(const std::string &msg)
    {
        for (auto h : state_.ws_clients)
        {
            auto *s = static_cast<Session *>(h);
            s->send(msg);
        }
    }

    void close()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        // sessions may outlive the state once the io_context is torn down
        for (auto h : state_.ws_clients)
            static_cast<Session *>(h)->registered = false;
        state_.ws_clients.clear();
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
if (ec == boost::asio::error::operation_aborted) return;
if(!ec) std::make_shared<Session>(std::move(socket_), state_)->run();
do_accept(); });
    }
    struct Session : std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::asio::ip::tcp::socket> ws;
        boost::beast::flat_buffer buffer;
        SessionState &state;
        std::deque<std::shared_ptr<const std::string>> outbox;
        bool registered = false;
        Session(boost::asio::ip::tcp::socket &&s, SessionState &st)
            : ws(std::move(s)), state(st) {}
        void run()
        {
            ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            auto self = shared_from_this();
            ws.async_accept([self](boost::beast::error_code ec)
                            {
                if (ec)
                {
                    lanwake::log::warn("ws", "handshake failed: " + ec.message());
                    return;
                }
                self->state.ws_clients.insert(self.get());
                self->registered = true;
                self->send(nlohmann::json{{"topic", "fleet.status"}, {"payload", fleet_to_json(*self->state.controller)}}.dump());
                self->do_read(); });
        }
        ~Session()
        {
            if (registered)
                state.ws_clients.erase(this);
        }
        void do_read()
        {
            auto self = shared_from_this();
            ws.async_read(buffer, [self](auto ec, auto)
                          {
                if (ec)
                {
                    self->state.ws_clients.erase(self.get());
                    self->registered = false;
                    return;
                }
                self->buffer.consume(self->buffer.size());
                self->do_read(); });
        }
        void send(const std::string &s)
        {
            outbox.push_back(std::make_shared<const std::string>(s));
            if (outbox.size() == 1)
                do_write();
        }
        void do_write()
        {
            auto self = shared_from_this();
            ws.text(true);
            ws.async_write(boost::asio::buffer(*outbox.front()), [self](auto ec, auto)
                           {
                if (ec)
                {
                    self->outbox.clear();
                    return;
                }
                self->outbox.pop_front();
                if (!self->outbox.empty())
                    self->do_write(); });
        }
    };
};
