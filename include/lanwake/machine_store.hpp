/*
 * File: include/lanwake/machine_store.hpp
 * Project: LanWake
 * Purpose: JSON-file persistence of machine records (list / add / edit / import / export)
 * Notes:
 *  - See DESIGN.md
 *  - Saves go through write_atomic (tmp file, fsync, rename)
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include "lanwake/machine.hpp"

namespace lanwake
{

namespace fs = std::filesystem;

// Atomic file writer: writes to <path>.tmp, fsyncs, then rename() to final.
inline void write_atomic(const fs::path &final_path, const std::string &data)
{
    fs::path tmp = final_path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw std::runtime_error("Failed to open temp file: " + tmp.string());
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
    }
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        ::fsync(fd);
        ::close(fd);
    }
    std::error_code ec;
    fs::rename(tmp, final_path, ec);
    if (ec)
        throw std::runtime_error("rename " + tmp.string() + " -> " + final_path.string() + " failed: " + ec.message());
}

inline std::string new_machine_id()
{
    static boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

inline std::vector<Machine> machines_from_json(const nlohmann::json &j)
{
    if (!j.is_array())
        throw std::runtime_error("machine document must be a JSON array");
    std::vector<Machine> out;
    out.reserve(j.size());
    for (const auto &item : j)
    {
        if (!item.is_object())
            throw std::runtime_error("machine entry must be a JSON object");
        out.push_back(machine_from_json(item));
    }
    return out;
}

inline nlohmann::json machines_to_json(const std::vector<Machine> &machines)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &m : machines)
        arr.push_back(machine_to_json(m));
    return arr;
}

inline std::vector<Machine> read_machines_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("failed to open machine file: " + path.string());
    nlohmann::json j;
    try
    {
        f >> j;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error("failed to parse " + path.string() + ": " + e.what());
    }
    return machines_from_json(j);
}

class MachineStore
{
public:
    explicit MachineStore(fs::path path) : path_(std::move(path)) {}

    // A missing file is an empty store.
    void load()
    {
        std::error_code ec;
        if (!fs::exists(path_, ec))
        {
            machines_.clear();
            return;
        }
        machines_ = read_machines_file(path_);
    }

    void save() const
    {
        write_atomic(path_, machines_to_json(machines_).dump(2));
    }

    const std::vector<Machine> &list_machines() const { return machines_; }
    const fs::path &path() const { return path_; }

    // Matches id first, then exact name.
    std::optional<Machine> find(const std::string &id_or_name) const
    {
        auto it = std::find_if(machines_.begin(), machines_.end(),
                               [&](const Machine &m) { return m.id == id_or_name; });
        if (it == machines_.end())
            it = std::find_if(machines_.begin(), machines_.end(),
                              [&](const Machine &m) { return m.name == id_or_name; });
        if (it == machines_.end())
            return std::nullopt;
        return *it;
    }

    Machine add(Machine m)
    {
        if (m.id.empty())
            m.id = new_machine_id();
        if (find_index(m.id))
            throw std::runtime_error("duplicate machine id: " + m.id);
        machines_.push_back(m);
        save();
        return m;
    }

    void update(const Machine &m)
    {
        auto idx = find_index(m.id);
        if (!idx)
            throw std::runtime_error("no machine with id " + m.id);
        machines_[*idx] = m;
        save();
    }

    bool remove(const std::string &id_or_name)
    {
        auto m = find(id_or_name);
        if (!m)
            return false;
        machines_.erase(machines_.begin() + static_cast<std::ptrdiff_t>(*find_index(m->id)));
        save();
        return true;
    }

    // Replaces the whole list; entries without an id get a fresh one.
    std::size_t import_from(const fs::path &src)
    {
        auto imported = read_machines_file(src);
        for (auto &m : imported)
            if (m.id.empty())
                m.id = new_machine_id();
        machines_ = std::move(imported);
        save();
        return machines_.size();
    }

    void export_to(const fs::path &dst) const
    {
        write_atomic(dst, machines_to_json(machines_).dump(2));
    }

private:
    std::optional<std::size_t> find_index(const std::string &id) const
    {
        for (std::size_t i = 0; i < machines_.size(); ++i)
            if (machines_[i].id == id)
                return i;
        return std::nullopt;
    }

    fs::path path_;
    std::vector<Machine> machines_;
};

} // namespace lanwake
