/*
 * File: src/lanwake_main.cpp
 * Project: LanWake
 * Purpose: Command line: machine records, wake-and-verify, status checks, serve session
 * Notes:
 *  - See DESIGN.md
 *  - Control work runs on one io_context thread; socket I/O on the Runtime worker
 *  - Nothing survives the process: status and wake sessions are in memory only
 * Last updated: 2026-10-18
 */

#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "lanwake/controller.hpp"
#include "lanwake/ipv4.hpp"
#include "lanwake/log.hpp"
#include "lanwake/machine_store.hpp"
#include "lanwake/runtime.hpp"
#include "lanwake/settings.hpp"
#include "lanwake_http.hpp"
#include "lanwake_state.hpp"
#include "lanwake_ws.hpp"

namespace
{

const char *kUsage =
    "usage: lanwake <command> [options]\n"
    "\n"
    "commands:\n"
    "  list                          show machines and record problems\n"
    "  add --name N --mac M --ip I [--mask K] [--broadcast B] [--port P] [--description D]\n"
    "  remove <id|name>\n"
    "  import <file>                 replace the machine list from a JSON export\n"
    "  export <file>\n"
    "  broadcast --ip I --mask K     print network and broadcast address\n"
    "  send <id|name>                transmit the magic packet only\n"
    "  wake <id|name>                send, then wait until the machine answers (Ctrl-C cancels)\n"
    "  status                        check every machine once\n"
    "  serve                         poll the fleet and serve HTTP / WebSocket until Ctrl-C\n"
    "\n"
    "options:\n"
    "  --config FILE      JSON settings (default $LANWAKE_CONFIG)\n"
    "  --machines FILE    machine store (default machines.json)\n"
    "  --wol-port N       magic packet UDP port (default 9)\n"
    "  --interval S       status interval: 30, 60, 120, 300, 600, 1800\n"
    "  --timeout-ms N     status probe timeout\n"
    "  --http HOST:PORT   serve: HTTP bind\n"
    "  --ws HOST:PORT     serve: WebSocket bind\n"
    "  --no-secondary     skip the redundant async universal broadcast\n"
    "  --verbose          debug logging\n";

struct Args
{
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    bool has(const std::string &k) const { return options.count(k) != 0; }
    std::string get(const std::string &k, const std::string &def = "") const
    {
        auto it = options.find(k);
        return it == options.end() ? def : it->second;
    }
};

Args parse_args(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        if (s == "--no-secondary" || s == "--verbose" || s == "--help")
            a.options[s.substr(2)] = "1";
        else if (s.rfind("--", 0) == 0)
        {
            if (i + 1 >= argc)
                throw std::runtime_error("option " + s + " needs a value");
            a.options[s.substr(2)] = argv[++i];
        }
        else if (a.command.empty())
            a.command = s;
        else
            a.positional.push_back(s);
    }
    return a;
}

lanwake::Settings build_settings(const Args &a)
{
    using namespace std::chrono;
    lanwake::Settings s = a.has("config") ? lanwake::load_settings_file(a.get("config")) : lanwake::default_settings();
    if (a.has("machines"))
        s.machines_file = a.get("machines");
    if (a.has("wol-port"))
        s.wol_port = lanwake::checked_port(std::stoll(a.get("wol-port")), "--wol-port");
    if (a.has("interval"))
        s.status_interval = seconds(std::stol(a.get("interval")));
    if (a.has("timeout-ms"))
        s.status_probe_timeout = milliseconds(std::stol(a.get("timeout-ms")));
    if (a.has("http"))
        s.http_bind = a.get("http");
    if (a.has("ws"))
        s.ws_bind = a.get("ws");
    if (a.has("no-secondary"))
        s.secondary_broadcast = false;
    lanwake::validate_settings(s);
    return s;
}

std::string need_positional(const Args &a)
{
    if (a.positional.empty())
        throw std::runtime_error(a.command + ": missing argument\n" + kUsage);
    return a.positional.front();
}

lanwake::Machine need_machine(const lanwake::MachineStore &store, const std::string &key)
{
    auto m = store.find(key);
    if (!m)
        throw std::runtime_error("no machine with id or name \"" + key + "\"");
    return *m;
}

std::pair<std::string, unsigned short> split_bind(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos)
        throw std::runtime_error("bind must be HOST:PORT, got " + s);
    return {s.substr(0, p), static_cast<unsigned short>(std::stoi(s.substr(p + 1)))};
}

int cmd_list(const lanwake::MachineStore &store)
{
    const auto &machines = store.list_machines();
    if (machines.empty())
    {
        std::cout << "no machines in " << store.path().string() << "\n";
        return 0;
    }
    std::cout << std::left << std::setw(20) << "NAME" << std::setw(17) << "IP" << std::setw(19) << "MAC"
              << std::setw(7) << "PORT" << "ID\n";
    for (const auto &m : machines)
    {
        std::cout << std::left << std::setw(20) << m.name << std::setw(17) << m.ipv4_address << std::setw(19)
                  << m.mac_address << std::setw(7) << m.ping_port << m.id << "\n";
        for (const auto &p : lanwake::validate_machine(m))
            std::cout << "    ! " << p << "\n";
    }
    return 0;
}

int cmd_add(lanwake::MachineStore &store, const Args &a)
{
    lanwake::Machine m;
    m.name = a.get("name");
    m.mac_address = a.get("mac");
    m.ipv4_address = a.get("ip");
    m.description = a.get("description");
    m.ping_port = a.has("port") ? std::stoi(a.get("port")) : 22;
    if (a.has("mask"))
    {
        m.mask = a.get("mask");
        m.broadcast_address = a.get("broadcast", lanwake::calculate_broadcast(m.ipv4_address, m.mask).value_or(""));
    }
    else if (auto net = lanwake::auto_network_settings(m.ipv4_address))
    {
        m.mask = net->mask;
        m.broadcast_address = a.get("broadcast", net->broadcast);
    }
    auto problems = lanwake::validate_machine(m);
    if (!problems.empty())
    {
        std::string msg = "cannot add machine:";
        for (const auto &p : problems)
            msg += "\n  - " + p;
        throw std::runtime_error(msg);
    }
    auto added = store.add(m);
    std::cout << "added " << added.name << " (" << added.id << ") broadcast " << added.broadcast_address << "\n";
    return 0;
}

int cmd_broadcast(const Args &a)
{
    const std::string ip = a.get("ip");
    const std::string mask = a.get("mask");
    if (!lanwake::is_valid_ipv4(ip))
        throw std::runtime_error("invalid IPv4 address: " + ip);
    if (!lanwake::is_valid_subnet_mask(mask))
        throw std::runtime_error("invalid subnet mask: " + mask);
    std::cout << "network   " << lanwake::calculate_network(ip, mask).value_or("?") << "\n"
              << "broadcast " << lanwake::calculate_broadcast(ip, mask).value_or("?") << "\n";
    return 0;
}

int cmd_send(const lanwake::Settings &settings, const lanwake::Machine &m)
{
    boost::asio::io_context ioc{1};
    lanwake::Runtime rt{ioc, settings};
    rt.packets().send(m.mac_address, m.broadcast_address, settings.wol_port);
    rt.drain();
    return 0;
}

int cmd_wake(const lanwake::Settings &settings, const lanwake::MachineStore &store, const lanwake::Machine &m)
{
    boost::asio::io_context ioc{1};
    lanwake::Runtime rt{ioc, settings};
    lanwake::Controller ctl{rt.scheduler(), rt.transmitter(), rt.prober(), settings};
    ctl.set_machines(store.list_machines());

    std::string last;
    ctl.wake_session().subscribe([&last](const lanwake::WakeSnapshot &w)
                                 {
        if (w.status_message == last)
            return;
        last = w.status_message;
        std::cout << "[" << w.machine_name << "] " << w.status_message << std::endl; });

    int exit_code = 1;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int)
                       {
        if (ec)
            return;
        exit_code = ctl.cancel_wake() ? 3 : exit_code;
        ioc.stop(); });

    ctl.wake(m, [&](lanwake::WakeOutcome outcome)
             {
        exit_code = outcome == lanwake::WakeOutcome::Success ? 0 : 2;
        signals.cancel();
        ioc.stop(); });

    ioc.run();
    rt.drain();
    return exit_code;
}

int cmd_status(const lanwake::Settings &settings, const lanwake::MachineStore &store)
{
    boost::asio::io_context ioc{1};
    lanwake::Runtime rt{ioc, settings};
    lanwake::Controller ctl{rt.scheduler(), rt.transmitter(), rt.prober(), settings};
    ctl.set_machines(store.list_machines());

    ctl.fleet().subscribe([&ctl](const std::string &id, const lanwake::MachineStatus &st)
                          {
        if (st.checking)
            return;
        auto m = ctl.find(id);
        std::cout << std::left << std::setw(20) << (m ? m->name : id) << (st.reachable ? "Online" : "Offline") << std::endl; });

    ctl.fleet().check_all(ctl.machines(), [&ioc]
                          { ioc.stop(); });
    ioc.run();
    rt.drain();
    return 0;
}

int cmd_serve(const lanwake::Settings &settings, const lanwake::MachineStore &store)
{
    boost::asio::io_context ioc{1};
    lanwake::Runtime rt{ioc, settings};
    lanwake::Controller ctl{rt.scheduler(), rt.transmitter(), rt.prober(), settings};
    ctl.set_machines(store.list_machines());

    SessionState state;
    state.controller = &ctl;
    state.settings = &settings;

    auto [http_host, http_port] = split_bind(settings.http_bind);
    auto [ws_host, ws_port] = split_bind(settings.ws_bind);
    boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), http_port};
    boost::asio::ip::tcp::endpoint ws_ep{boost::asio::ip::make_address(ws_host), ws_port};

    HttpServer http{ioc, http_ep, state};
    WsServer ws{ioc, ws_ep, state};

    ctl.fleet().subscribe([&ws](const std::string &id, const lanwake::MachineStatus &st)
                          { ws.publish("machine.status", status_to_json(id, st)); });
    ctl.wake_session().subscribe([&ws, &ctl](const lanwake::WakeSnapshot &w)
                                 { ws.publish("wake.session", wake_to_json(w, ctl.wake_session().can_cancel())); });

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int)
                       {
        if (ec)
            return;
        lanwake::log::info("serve", "shutting down");
        ctl.cancel_wake();
        ctl.stop_polling();
        http.close();
        ws.close();
        ioc.stop(); });

    ctl.start_polling();
    std::cout << "lanwake listening http=" << settings.http_bind << " ws=" << settings.ws_bind
              << " machines=" << ctl.machines().size() << " interval=" << settings.status_interval.count() << "s\n";

    ioc.run();
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    try
    {
        Args args = parse_args(argc, argv);
        if (args.command.empty() || args.has("help"))
        {
            std::cout << kUsage;
            return args.command.empty() && !args.has("help") ? 1 : 0;
        }
        if (args.has("verbose"))
            lanwake::log::set_level(lanwake::log::Level::debug);

        const lanwake::Settings settings = build_settings(args);
        lanwake::MachineStore store{settings.machines_file};
        store.load();

        const std::string &cmd = args.command;
        if (cmd == "list")
            return cmd_list(store);
        if (cmd == "add")
            return cmd_add(store, args);
        if (cmd == "remove")
        {
            const auto key = need_positional(args);
            if (!store.remove(key))
                throw std::runtime_error("no machine with id or name \"" + key + "\"");
            std::cout << "removed " << key << "\n";
            return 0;
        }
        if (cmd == "import")
        {
            auto n = store.import_from(need_positional(args));
            std::cout << "imported " << n << " machines into " << store.path().string() << "\n";
            return 0;
        }
        if (cmd == "export")
        {
            store.export_to(need_positional(args));
            std::cout << "exported " << store.list_machines().size() << " machines\n";
            return 0;
        }
        if (cmd == "broadcast")
            return cmd_broadcast(args);
        if (cmd == "send")
            return cmd_send(settings, need_machine(store, need_positional(args)));
        if (cmd == "wake")
            return cmd_wake(settings, store, need_machine(store, need_positional(args)));
        if (cmd == "status")
            return cmd_status(settings, store);
        if (cmd == "serve")
            return cmd_serve(settings, store);

        std::cerr << "unknown command: " << cmd << "\n"
                  << kUsage;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "lanwake error: " << e.what() << "\n";
        return 1;
    }
}
