/*
 * File: include/lanwake/settings.hpp
 * Project: LanWake
 * Purpose: Process configuration, built once in main and passed by reference
 * Notes:
 *  - See DESIGN.md
 *  - JSON file first, command line flags override
 * Last updated: 2026-10-18
 */

#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace lanwake
{

// Intervals the fleet poller may be switched between.
constexpr std::array<int, 6> kStatusIntervalsS{30, 60, 120, 300, 600, 1800};

inline bool is_supported_interval(long long seconds)
{
    for (int s : kStatusIntervalsS)
        if (s == seconds)
            return true;
    return false;
}

struct Settings
{
    // transmitter
    std::uint16_t wol_port{9};
    std::chrono::milliseconds send_timeout{1000};
    bool secondary_broadcast{true};

    // reachability probe profiles
    std::chrono::milliseconds status_probe_timeout{2000};
    std::chrono::milliseconds wake_probe_timeout{5000};

    // wake session
    std::chrono::milliseconds wake_initial_delay{1000};
    std::chrono::milliseconds wake_cadence{2000};
    int wake_max_attempts{30};
    std::chrono::milliseconds verify_after_success{8000};
    std::chrono::milliseconds verify_after_timeout{2000};

    // fleet poller
    std::chrono::seconds status_interval{120};

    // collaborators
    std::string machines_file{"machines.json"};
    std::string http_bind{"127.0.0.1:8080"};
    std::string ws_bind{"127.0.0.1:8090"};
};

// UDP ports are 1..65535; anything else is rejected rather than wrapped.
inline std::uint16_t checked_port(long long value, const std::string &what)
{
    if (value < 1 || value > 65535)
        throw std::runtime_error(what + " must be in 1..65535 (got " + std::to_string(value) + ")");
    return static_cast<std::uint16_t>(value);
}

inline void validate_settings(const Settings &s)
{
    if (s.wol_port == 0)
        throw std::runtime_error("wol_port must be non-zero");
    if (s.wake_max_attempts <= 0)
        throw std::runtime_error("wake_max_attempts must be positive");
    if (s.wake_cadence.count() <= 0 || s.status_probe_timeout.count() <= 0 || s.wake_probe_timeout.count() <= 0)
        throw std::runtime_error("cadence and probe timeouts must be positive");
    if (!is_supported_interval(s.status_interval.count()))
        throw std::runtime_error("status_interval_s must be one of 30, 60, 120, 300, 600, 1800 (got " +
                                 std::to_string(s.status_interval.count()) + ")");
}

inline void apply_settings_json(Settings &s, const nlohmann::json &j)
{
    using std::chrono::milliseconds;
    using std::chrono::seconds;
    if (!j.is_object())
        throw std::runtime_error("config must be a JSON object");
    s.wol_port = checked_port(j.value("wol_port", static_cast<long long>(s.wol_port)), "wol_port");
    s.send_timeout = milliseconds(j.value("send_timeout_ms", static_cast<long>(s.send_timeout.count())));
    s.secondary_broadcast = j.value("secondary_broadcast", s.secondary_broadcast);
    s.status_probe_timeout = milliseconds(j.value("status_probe_timeout_ms", static_cast<long>(s.status_probe_timeout.count())));
    s.wake_probe_timeout = milliseconds(j.value("wake_probe_timeout_ms", static_cast<long>(s.wake_probe_timeout.count())));
    s.wake_initial_delay = milliseconds(j.value("wake_initial_delay_ms", static_cast<long>(s.wake_initial_delay.count())));
    s.wake_cadence = milliseconds(j.value("wake_cadence_ms", static_cast<long>(s.wake_cadence.count())));
    s.wake_max_attempts = j.value("wake_max_attempts", s.wake_max_attempts);
    s.verify_after_success = milliseconds(j.value("verify_after_success_ms", static_cast<long>(s.verify_after_success.count())));
    s.verify_after_timeout = milliseconds(j.value("verify_after_timeout_ms", static_cast<long>(s.verify_after_timeout.count())));
    s.status_interval = seconds(j.value("status_interval_s", static_cast<long>(s.status_interval.count())));
    s.machines_file = j.value("machines_file", s.machines_file);
    s.http_bind = j.value("http", s.http_bind);
    s.ws_bind = j.value("ws", s.ws_bind);
}

inline Settings load_settings_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("failed to open config: " + path);
    nlohmann::json j;
    try
    {
        f >> j;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error("failed to parse config " + path + ": " + e.what());
    }
    Settings s;
    apply_settings_json(s, j);
    validate_settings(s);
    return s;
}

// $LANWAKE_CONFIG when set, otherwise built-in defaults.
inline Settings default_settings()
{
    if (const char *p = std::getenv("LANWAKE_CONFIG"); p && *p)
        return load_settings_file(p);
    return Settings{};
}

inline nlohmann::json settings_to_json(const Settings &s)
{
    return nlohmann::json{
        {"wol_port", s.wol_port},
        {"send_timeout_ms", s.send_timeout.count()},
        {"secondary_broadcast", s.secondary_broadcast},
        {"status_probe_timeout_ms", s.status_probe_timeout.count()},
        {"wake_probe_timeout_ms", s.wake_probe_timeout.count()},
        {"wake_initial_delay_ms", s.wake_initial_delay.count()},
        {"wake_cadence_ms", s.wake_cadence.count()},
        {"wake_max_attempts", s.wake_max_attempts},
        {"verify_after_success_ms", s.verify_after_success.count()},
        {"verify_after_timeout_ms", s.verify_after_timeout.count()},
        {"status_interval_s", s.status_interval.count()},
        {"machines_file", s.machines_file},
        {"http", s.http_bind},
        {"ws", s.ws_bind}};
}

} // namespace lanwake
