/*
 * File: include/lanwake/log.hpp
 * Project: LanWake
 * Purpose: Tagged line logging shared by the core and the binaries
 * Notes:
 *  - See DESIGN.md
 *  - One line per call: "[tag] LEVEL: message", std::cerr unless redirected
 * Last updated: 2026-10-18
 */

#pragma once
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace lanwake::log
{

enum class Level
{
    debug = 0,
    info,
    warn,
    error
};

inline const char *level_name(Level lv)
{
    switch (lv)
    {
    case Level::debug:
        return "DEBUG";
    case Level::info:
        return "INFO";
    case Level::warn:
        return "WARN";
    case Level::error:
        return "ERROR";
    }
    return "?";
}

namespace detail
{
struct Sink
{
    std::mutex mtx;
    std::ostream *out = &std::cerr;
    Level min_level = Level::info;
};

inline Sink &sink()
{
    static Sink s;
    return s;
}
} // namespace detail

// Redirects every subsequent line; the stream must outlive its use.
inline void set_sink(std::ostream &out)
{
    auto &s = detail::sink();
    std::scoped_lock lk(s.mtx);
    s.out = &out;
}

inline void reset_sink()
{
    set_sink(std::cerr);
}

inline void set_level(Level lv)
{
    auto &s = detail::sink();
    std::scoped_lock lk(s.mtx);
    s.min_level = lv;
}

inline void write(Level lv, const std::string &tag, const std::string &msg)
{
    auto &s = detail::sink();
    std::scoped_lock lk(s.mtx);
    if (lv < s.min_level)
        return;
    (*s.out) << "[" << tag << "] " << level_name(lv) << ": " << msg << "\n";
    s.out->flush();
}

inline void debug(const std::string &tag, const std::string &msg) { write(Level::debug, tag, msg); }
inline void info(const std::string &tag, const std::string &msg) { write(Level::info, tag, msg); }
inline void warn(const std::string &tag, const std::string &msg) { write(Level::warn, tag, msg); }
inline void error(const std::string &tag, const std::string &msg) { write(Level::error, tag, msg); }

// Captures every line written while alive; used by tests to assert on diagnostics.
class ScopedCapture
{
public:
    ScopedCapture() { set_sink(buf_); }
    ~ScopedCapture() { reset_sink(); }
    ScopedCapture(const ScopedCapture &) = delete;
    ScopedCapture &operator=(const ScopedCapture &) = delete;

    std::string text() const { return buf_.str(); }
    bool contains(const std::string &needle) const { return buf_.str().find(needle) != std::string::npos; }

private:
    std::ostringstream buf_;
};

} // namespace lanwake::log
