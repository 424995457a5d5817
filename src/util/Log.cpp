// ==========================
// Log.cpp
// ==========================
// Threshold handling and serialized output for the tagged logger.
// ==========================

#include "util/Log.hpp"
#include "util/Strings.hpp"                 // to_lower

#include <atomic>                         // std::atomic for the global threshold
#include <iostream>                       // std::clog
#include <mutex>                          // std::mutex, std::lock_guard

namespace logging {

namespace {
std::atomic<int> g_level{static_cast<int>(Level::Warn)}; // current threshold
std::mutex g_out_mu;                                     // serializes writes to std::clog

const char* levelName(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   break;
    }
    return "off";
}
} // namespace

void setLevel(Level lvl) noexcept { g_level.store(static_cast<int>(lvl)); }

Level level() noexcept { return static_cast<Level>(g_level.load()); }

bool parseLevel(const std::string& name, Level& out) {
    const std::string s = to_lower(name);
    if (s == "debug") { out = Level::Debug; return true; }
    if (s == "info")  { out = Level::Info;  return true; }
    if (s == "warn" || s == "warning") { out = Level::Warn; return true; }
    if (s == "error") { out = Level::Error; return true; }
    if (s == "off")   { out = Level::Off;   return true; }
    return false;                                        // unknown name, caller reports it
}

bool enabled(Level lvl) noexcept {
    return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load();
}

void write(Level lvl, const std::string& tag, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(g_out_mu);         // one line at a time
    std::clog << "[" << tag << "] " << levelName(lvl) << ": " << msg << std::endl;
}

} // namespace logging
