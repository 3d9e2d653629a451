/*
 * File: src/lanwake_state.hpp
 * Project: LanWake
 * Purpose: Shared state of the serve session and its JSON views
 * Notes:
 *  - See DESIGN.md
 *  - Everything here is touched from the control io_context thread only
 * Last updated: 2026-10-18
 */

#pragma once
#include <unordered_set>
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "lanwake/controller.hpp"
#include "lanwake/settings.hpp"


struct SessionState {
lanwake::Controller* controller = nullptr;
const lanwake::Settings* settings = nullptr;
std::unordered_set<void*> ws_clients; // track raw ptr keys
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};


// RFC3339 UTC with milliseconds (e.g., 2026-10-18T14:59:01.234Z)
inline std::string iso8601_ms(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    auto t = time_point_cast<milliseconds>(tp);
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline nlohmann::json status_to_json(const std::string &id, const lanwake::MachineStatus &st)
{
    nlohmann::json j{{"id", id}, {"reachable", st.reachable}, {"checking", st.checking}};
    j["last_checked"] = st.last_checked ? nlohmann::json(iso8601_ms(*st.last_checked)) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json wake_to_json(const lanwake::WakeSnapshot &w, bool can_cancel)
{
    return nlohmann::json{
        {"state", lanwake::to_string(w.state)},
        {"machine_id", w.machine_id},
        {"machine_name", w.machine_name},
        {"attempts", w.attempts},
        {"max_attempts", w.max_attempts},
        {"reachable", w.reachable},
        {"status_message", w.status_message},
        {"can_cancel", can_cancel}};
}

// Machines with their live status plus the countdown metadata.
inline nlohmann::json fleet_to_json(const lanwake::Controller &c)
{
    using nlohmann::json;
    const auto &fleet = c.fleet();
    json machines = json::array();
    for (const auto &m : c.machines())
    {
        json jm = lanwake::machine_to_json(m);
        jm["status"] = status_to_json(m.id, fleet.status(m.id));
        machines.push_back(jm);
    }
    json j{{"machines", machines},
           {"interval_s", fleet.interval().count()},
           {"polling", fleet.running()}};
    auto pending = fleet.pending_interval();
    j["pending_interval_s"] = pending ? json(pending->count()) : json(nullptr);
    auto next = fleet.next_check_date();
    j["next_check"] = next ? json(iso8601_ms(*next)) : json(nullptr);
    return j;
}
