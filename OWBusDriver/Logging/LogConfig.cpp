//
// LogConfig.cpp
// OWBus
//
// Runtime logging configuration implementation
//

#include "LogConfig.hpp"
#include "Logging.hpp"

#include "../Common/EnvVars.hpp"

namespace OWBus {

// ============================================================================
// Singleton Access
// ============================================================================

LogConfig& LogConfig::Shared() {
    static LogConfig instance;
    return instance;
}

LogConfig::LogConfig() = default;

// ============================================================================
// Initialization
// ============================================================================

void LogConfig::Initialize() {
    if (initialized_.exchange(true)) {
        OWBUS_LOG_V3(Config, "LogConfig already initialized, skipping");
        return;
    }

    discoveryVerbosity_.store(ReadLevelVariable("OWBUS_DISCOVERY_VERBOSITY", 1));
    deviceVerbosity_.store(ReadLevelVariable("OWBUS_DEVICE_VERBOSITY", 1));
    transportVerbosity_.store(ReadLevelVariable("OWBUS_TRANSPORT_VERBOSITY", 1));
    enableHexDumps_.store(ReadBoolVariable("OWBUS_ENABLE_HEX_DUMPS", false));
    mirrorToStderr_.store(ReadBoolVariable("OWBUS_LOG_STDERR", false));

    OWBUS_LOG_INFO(Config,
                   "LogConfig initialized: Discovery=%u Device=%u Transport=%u HexDumps=%d Stderr=%d",
                   discoveryVerbosity_.load(), deviceVerbosity_.load(), transportVerbosity_.load(),
                   enableHexDumps_.load(), mirrorToStderr_.load());
}

void LogConfig::Reset() {
    discoveryVerbosity_.store(1);
    deviceVerbosity_.store(1);
    transportVerbosity_.store(1);
    enableHexDumps_.store(false);
    mirrorToStderr_.store(false);
    initialized_.store(false);
}

// ============================================================================
// Getters (Thread-Safe)
// ============================================================================

uint8_t LogConfig::GetDiscoveryVerbosity() const {
    return discoveryVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetDeviceVerbosity() const {
    return deviceVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetTransportVerbosity() const {
    return transportVerbosity_.load(std::memory_order_relaxed);
}

// Config messages follow the discovery level; there is no separate knob.
uint8_t LogConfig::GetConfigVerbosity() const {
    return discoveryVerbosity_.load(std::memory_order_relaxed);
}

bool LogConfig::IsHexDumpsEnabled() const {
    return enableHexDumps_.load(std::memory_order_relaxed);
}

bool LogConfig::IsStderrMirrorEnabled() const {
    return mirrorToStderr_.load(std::memory_order_relaxed);
}

// ============================================================================
// Runtime Setters (Thread-Safe)
// ============================================================================

void LogConfig::SetDiscoveryVerbosity(uint8_t level) {
    level = ClampLevel(level);
    discoveryVerbosity_.store(level, std::memory_order_relaxed);
    OWBUS_LOG_INFO(Config, "Discovery verbosity changed to %u", level);
}

void LogConfig::SetDeviceVerbosity(uint8_t level) {
    level = ClampLevel(level);
    deviceVerbosity_.store(level, std::memory_order_relaxed);
    OWBUS_LOG_INFO(Config, "Device verbosity changed to %u", level);
}

void LogConfig::SetTransportVerbosity(uint8_t level) {
    level = ClampLevel(level);
    transportVerbosity_.store(level, std::memory_order_relaxed);
    OWBUS_LOG_INFO(Config, "Transport verbosity changed to %u", level);
}

void LogConfig::SetHexDumps(bool enable) {
    enableHexDumps_.store(enable, std::memory_order_relaxed);
    OWBUS_LOG_INFO(Config, "Hex dumps %s", enable ? "enabled" : "disabled");
}

void LogConfig::SetStderrMirror(bool enable) {
    mirrorToStderr_.store(enable, std::memory_order_relaxed);
}

// ============================================================================
// Private Helpers
// ============================================================================

uint8_t LogConfig::ReadLevelVariable(const char* name, uint8_t defaultValue) {
    const auto parsed = Env::ReadUnsigned(name);
    if (!parsed) {
        OWBUS_LOG_V3(Config, "Variable '%s' = %u (default)", name, defaultValue);
        return defaultValue;
    }

    const uint8_t value = *parsed > 4 ? 4 : static_cast<uint8_t>(*parsed);
    OWBUS_LOG_INFO(Config, "Variable '%s' = %u (from environment)", name, value);
    return value;
}

bool LogConfig::ReadBoolVariable(const char* name, bool defaultValue) {
    const auto parsed = Env::ReadBool(name);
    if (!parsed) {
        OWBUS_LOG_V3(Config, "Variable '%s' = %s (default)", name, defaultValue ? "true" : "false");
        return defaultValue;
    }

    OWBUS_LOG_INFO(Config, "Variable '%s' = %s (from environment)", name, *parsed ? "true" : "false");
    return *parsed;
}

} // namespace OWBus
