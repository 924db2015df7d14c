#pragma once
#include <cstdlib>
#include <iostream>

namespace Logger {

enum class Level : int {
    Quiet = 0, // LDE_QUIET=1
    Debug = 1, // default in debug builds
    Trace = 2  // LDE_TRACE=1
};

inline bool env_flag(const char* name) {
    const char* val = std::getenv(name);
    return val && val[0] == '1';
}

// Resolved once per process. Release builds never log.
inline Level level() {
#ifndef NDEBUG
    static const Level resolved = []() {
        if (env_flag("LDE_TRACE")) return Level::Trace;
        if (env_flag("LDE_QUIET")) return Level::Quiet;
        return Level::Debug;
    }();
    return resolved;
#else
    return Level::Quiet;
#endif
}

inline bool enabled(Level at) {
    return static_cast<int>(level()) >= static_cast<int>(at);
}

} // namespace Logger

#ifdef NDEBUG
#define LDE_DEBUG_LOG(expr) do {} while (0)
#define LDE_TRACE_LOG(expr) do {} while (0)
#else
#define LDE_DEBUG_LOG(expr) do { if (::Logger::enabled(::Logger::Level::Debug)) { std::cerr << expr; } } while (0)
#define LDE_TRACE_LOG(expr) do { if (::Logger::enabled(::Logger::Level::Trace)) { std::cerr << expr; } } while (0)
#endif
