#pragma once                              // ensure this header is included only once per translation unit

#include <sstream>                        // std::ostringstream for message building
#include <string>                         // std::string

// ==========================
// Minimal tagged logger
// ==========================
// Writes lines of the form "[tag] message" to std::clog, the same shape the
// servers print ("[server] ..."). Writes are serialized so algorithms running
// in parallel batch tasks do not interleave their output.
// ==========================

namespace logging {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Global threshold; messages below it are dropped. Default: Warn.
void setLevel(Level level) noexcept;
Level level() noexcept;

// Parse "debug", "info", "warn", "error", "off" (case-insensitive).
// Returns false and leaves `out` untouched on an unknown name.
bool parseLevel(const std::string& name, Level& out);

// True if a message at `lvl` would be written.
bool enabled(Level lvl) noexcept;

// Write one line "[tag] msg" if `lvl` passes the threshold.
void write(Level lvl, const std::string& tag, const std::string& msg);

// Stream-style helper: joins `args` with operator<< and writes one line.
// The arguments are only formatted when `lvl` passes the threshold.
template <class... A>
void log(Level lvl, const std::string& tag, const A&... args) {
    if (!enabled(lvl)) return;                    // skip formatting entirely
    std::ostringstream oss;                       // build the message
    (oss << ... << args);                         // fold every argument in order
    write(lvl, tag, oss.str());
}

template <class... A>
void debug(const std::string& tag, const A&... args) { log(Level::Debug, tag, args...); }

template <class... A>
void warn(const std::string& tag, const A&... args) { log(Level::Warn, tag, args...); }

} // namespace logging
