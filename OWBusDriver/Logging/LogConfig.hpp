//
// LogConfig.hpp
// OWBus
//
// Runtime logging configuration singleton
// Seeds verbosity levels from the process environment and supports runtime updates
//

#ifndef OWBUS_LOGGING_LOGCONFIG_HPP
#define OWBUS_LOGGING_LOGCONFIG_HPP

#include <stdint.h>
#include <atomic>

namespace OWBus {

/**
 * @brief Centralized logging configuration manager
 *
 * Reads verbosity settings from environment variables:
 * - OWBUS_DISCOVERY_VERBOSITY (integer 0-4): bus search and family resolution
 * - OWBUS_DEVICE_VERBOSITY (integer 0-4): per-device command framing and decode
 * - OWBUS_TRANSPORT_VERBOSITY (integer 0-4): raw transport traffic
 * - OWBUS_ENABLE_HEX_DUMPS (boolean): Force enable/disable frame dumps
 * - OWBUS_LOG_STDERR (boolean): Mirror every log line to stderr
 *
 * Thread-safe singleton with runtime update support.
 */
class LogConfig {
public:
    /**
     * @brief Get singleton instance
     */
    static LogConfig& Shared();

    /**
     * @brief Initialize from the process environment
     *
     * Unset or unparsable variables keep their defaults. Only the first call
     * has any effect.
     */
    void Initialize();

    // ========================================================================
    // Getters (thread-safe, const)
    // ========================================================================

    /**
     * @brief Get Discovery subsystem verbosity level (0-4)
     */
    uint8_t GetDiscoveryVerbosity() const;

    /**
     * @brief Get Device subsystem verbosity level (0-4)
     */
    uint8_t GetDeviceVerbosity() const;

    uint8_t GetTransportVerbosity() const;
    uint8_t GetConfigVerbosity() const;

    /**
     * @brief Check if hex dumps are enabled
     */
    bool IsHexDumpsEnabled() const;

    bool IsStderrMirrorEnabled() const;

    // ========================================================================
    // Runtime Setters (thread-safe)
    // ========================================================================

    void SetDiscoveryVerbosity(uint8_t level);
    void SetDeviceVerbosity(uint8_t level);
    void SetTransportVerbosity(uint8_t level);
    void SetHexDumps(bool enable);
    void SetStderrMirror(bool enable);

    /**
     * @brief Restore defaults and allow Initialize() to run again
     */
    void Reset();

private:
    LogConfig();
    ~LogConfig() = default;

    LogConfig(const LogConfig&) = delete;
    LogConfig& operator=(const LogConfig&) = delete;

    static uint8_t ReadLevelVariable(const char* name, uint8_t defaultValue);
    static bool ReadBoolVariable(const char* name, bool defaultValue);
    static uint8_t ClampLevel(uint8_t level) { return level > 4 ? 4 : level; }

    std::atomic<uint8_t> discoveryVerbosity_{1};
    std::atomic<uint8_t> deviceVerbosity_{1};
    std::atomic<uint8_t> transportVerbosity_{1};
    std::atomic<bool> enableHexDumps_{false};
    std::atomic<bool> mirrorToStderr_{false};
    std::atomic<bool> initialized_{false};
};

} // namespace OWBus

#endif // OWBUS_LOGGING_LOGCONFIG_HPP
