/*
 * File: include/lanwake/machine.hpp
 * Project: LanWake
 * Purpose: Machine record and its JSON form
 * Notes:
 *  - See DESIGN.md
 *  - Records are read-only to the wake / status core
 * Last updated: 2026-10-18
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "lanwake/ipv4.hpp"
#include "lanwake/mac_codec.hpp"


namespace lanwake
{

struct Machine {
std::string id;
std::string name;
std::string mac_address;
std::string ipv4_address;
std::string mask{"255.255.255.0"};
std::string broadcast_address;
std::string description;
int ping_port{22};
};


// Field names match the exported machines.json documents.
inline nlohmann::json machine_to_json(const Machine& m){
return nlohmann::json{
{"id", m.id},
{"name", m.name},
{"macAddress", m.mac_address},
{"ipv4Address", m.ipv4_address},
{"mask", m.mask},
{"broadcastAddress", m.broadcast_address},
{"description", m.description},
{"pingPort", m.ping_port}
};
}


inline Machine machine_from_json(const nlohmann::json& j){
Machine m;
m.id = j.value("id", std::string());
m.name = j.value("name", std::string());
m.mac_address = j.value("macAddress", std::string());
m.ipv4_address = j.value("ipv4Address", std::string());
m.mask = j.value("mask", std::string("255.255.255.0"));
m.broadcast_address = j.value("broadcastAddress", std::string());
m.description = j.value("description", std::string());
m.ping_port = j.value("pingPort", 22);
return m;
}


// Empty result means the record is usable for wake and status checks.
inline std::vector<std::string> validate_machine(const Machine& m){
std::vector<std::string> problems;
if (m.name.empty()) problems.push_back("name is empty");
auto mac = parse_mac(m.mac_address);
if (!mac) problems.push_back(mac.reason);
if (!is_valid_ipv4(m.ipv4_address)) problems.push_back("invalid IPv4 address: " + m.ipv4_address);
if (!is_valid_subnet_mask(m.mask)) problems.push_back("invalid subnet mask: " + m.mask);
if (!is_valid_ipv4(m.broadcast_address)) problems.push_back("invalid broadcast address: " + m.broadcast_address);
else if (is_valid_ipv4(m.ipv4_address) && is_valid_subnet_mask(m.mask) && !is_valid_broadcast(m.ipv4_address, m.mask, m.broadcast_address))
    problems.push_back("broadcast " + m.broadcast_address + " does not match " + m.ipv4_address + "/" + m.mask
        + " (expected " + calculate_broadcast(m.ipv4_address, m.mask).value_or("?") + ")");
if (m.ping_port <= 0 || m.ping_port > 65535) problems.push_back("ping port out of range: " + std::to_string(m.ping_port));
return problems;
}

} // namespace lanwake
