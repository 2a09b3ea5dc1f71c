#pragma once

#include <syslog.h>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "LogConfig.hpp"

//
// Category logging on top of the system logger. Every macro prefixes the
// category name so journal output can be filtered per subsystem.
//

namespace OWBus::Logging {

struct Category {
    const char* name;
};

const Category& Discovery();
const Category& Device();
const Category& Transport();
const Category& Config();

// printf-style sink; priority is a syslog(3) level (LOG_ERR, LOG_INFO, ...)
void Write(const Category& category, int priority, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace OWBus::Logging

// ----- time helpers (header-only) -----
namespace OWBus::LogDetail {
inline uint64_t NowNs() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}
struct RlState {
    std::atomic<uint64_t> last_ns{0};
    std::atomic<uint64_t> suppressed{0};
};
} // namespace OWBus::LogDetail

// ----- Plain logging (category-stable prefixes) -----
#define OWBUS_LOG(cat, fmt, ...) \
    ::OWBus::Logging::Write(::OWBus::Logging::cat(), LOG_NOTICE, "[%s] " fmt, #cat, ##__VA_ARGS__)

#define OWBUS_LOG_TYPE(cat, priority, fmt, ...) \
    ::OWBus::Logging::Write(::OWBus::Logging::cat(), (priority), "[%s] " fmt, #cat, ##__VA_ARGS__)

// ----- Rate-limited logging -----
// key: per-callsite stable string (e.g. "therm/poll"); interval_ms: throttle window
#define OWBUS_LOG_RL(cat, key, interval_ms, priority, fmt, ...)                                 \
    do {                                                                                        \
        static ::OWBus::LogDetail::RlState _s;                                                  \
        const uint64_t _now = ::OWBus::LogDetail::NowNs();                                      \
        const uint64_t _intv = (uint64_t)(interval_ms) * 1000000ull;                            \
        uint64_t _last = _s.last_ns.load(std::memory_order_relaxed);                            \
        if (_now - _last >= _intv || _last == 0) {                                              \
            if (_s.last_ns.exchange(_now, std::memory_order_relaxed) != 0) {                    \
                uint64_t _lost = _s.suppressed.exchange(0, std::memory_order_relaxed);          \
                if (_lost) {                                                                    \
                    OWBUS_LOG_TYPE(cat, (priority), "[%s] (suppressed=%llu prior)", key,        \
                                   (unsigned long long)_lost);                                  \
                }                                                                               \
            }                                                                                   \
            OWBUS_LOG_TYPE(cat, (priority), "[%s] " fmt, key, ##__VA_ARGS__);                   \
        } else {                                                                                \
            _s.suppressed.fetch_add(1, std::memory_order_relaxed);                              \
        }                                                                                       \
    } while (0)

// Convenience shorthands
#define OWBUS_LOG_INFO(cat, fmt, ...)    OWBUS_LOG_TYPE(cat, LOG_INFO,    fmt, ##__VA_ARGS__)
#define OWBUS_LOG_ERROR(cat, fmt, ...)   OWBUS_LOG_TYPE(cat, LOG_ERR,     fmt, ##__VA_ARGS__)
#define OWBUS_LOG_WARNING(cat, fmt, ...) OWBUS_LOG_TYPE(cat, LOG_WARNING, fmt, ##__VA_ARGS__)
#define OWBUS_LOG_DEBUG(cat, fmt, ...)   OWBUS_LOG_TYPE(cat, LOG_DEBUG,   fmt, ##__VA_ARGS__)

// ============================================================================
// Runtime Verbosity-Aware Logging Macros
// ============================================================================
//
// Usage:
//   OWBUS_LOG_V0(Discovery, "Search failed");        // Level 0+ (always)
//   OWBUS_LOG_V1(Discovery, "Found %zu devices", n); // Level 1+ (summaries)
//   OWBUS_LOG_V2(Device, "Converting -> Ready");     // Level 2+ (transitions)
//   OWBUS_LOG_V3(Transport, "bit=%u", bit);          // Level 3+ (verbose)
//   OWBUS_LOG_HEX(Device, "frame: %s", hex);         // Hex dumps (flag or level 4)
//
// Levels come from LogConfig, seeded from OWBUS_<CATEGORY>_VERBOSITY.
//

#define OWBUS_GET_VERBOSITY(category) \
    (::OWBus::LogConfig::Shared().Get##category##Verbosity())

#define OWBUS_LOG_V0(category, fmt, ...) \
    do { \
        if (OWBUS_GET_VERBOSITY(category) >= 0) { \
            OWBUS_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define OWBUS_LOG_V1(category, fmt, ...) \
    do { \
        if (OWBUS_GET_VERBOSITY(category) >= 1) { \
            OWBUS_LOG_INFO(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define OWBUS_LOG_V2(category, fmt, ...) \
    do { \
        if (OWBUS_GET_VERBOSITY(category) >= 2) { \
            OWBUS_LOG_INFO(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define OWBUS_LOG_V3(category, fmt, ...) \
    do { \
        if (OWBUS_GET_VERBOSITY(category) >= 3) { \
            OWBUS_LOG_DEBUG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define OWBUS_LOG_V4(category, fmt, ...) \
    do { \
        if (OWBUS_GET_VERBOSITY(category) >= 4) { \
            OWBUS_LOG_DEBUG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

// Hex dumps: respects both explicit flag and verbosity level 4
#define OWBUS_LOG_HEX(category, fmt, ...) \
    do { \
        if (::OWBus::LogConfig::Shared().IsHexDumpsEnabled() || \
            OWBUS_GET_VERBOSITY(category) >= 4) { \
            OWBUS_LOG_DEBUG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)
