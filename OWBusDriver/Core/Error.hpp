// Error.hpp - std::expected based error handling for the 1-Wire protocol layer
//
// Every fallible operation returns Result<T>. Errors carry a category code,
// the capture site and a static message; nothing in this layer retries.
//
// Usage:
//   Result<Bytes> Thermometer::ReadPowerSupply() {
//       auto reply = SelectAndSend(cmd, 1);
//       if (!reply) {
//           return std::unexpected(reply.error());
//       }
//       return *reply;
//   }
//
//   // Caller
//   auto t = thermometer.ReadTemperature();
//   if (!t) {
//       t.error().Log();
//       if (t.error().code == ErrorCode::Timeout) { ... }
//   }

#pragma once

#include <cstdint>
#include <expected>
#include <string_view>
#include "../Logging/Logging.hpp"

namespace OWBus {

// ============================================================================
// Source Location
// ============================================================================

/// Call-site capture via compiler builtins
struct SourceLocation {
    const char* file;
    const char* function;
    int line;

    constexpr SourceLocation(
        const char* f = __builtin_FILE(),
        const char* fn = __builtin_FUNCTION(),
        int l = __builtin_LINE()) noexcept
        : file(f), function(fn), line(l) {}

    /// Extract filename from full path (strips directory)
    [[nodiscard]] constexpr std::string_view FileName() const noexcept {
        std::string_view path(file);
        auto pos = path.find_last_of('/');
        return (pos != std::string_view::npos) ? path.substr(pos + 1) : path;
    }
};

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : uint8_t {
    /// Bus reset/write/read failure reported by the transport
    Transport,
    /// ROM bytes of the wrong length, bad display string or CRC-8 mismatch
    MalformedAddress,
    /// Device answered, but the response is short or fails its CRC
    Protocol,
    /// Operation needs state that was never established (no prior read)
    State,
    /// Conversion-complete poll exceeded its deadline
    Timeout,
    /// Caller passed a value outside the command's domain
    InvalidArgument,
};

[[nodiscard]] constexpr const char* ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Transport:        return "transport";
        case ErrorCode::MalformedAddress: return "malformed_address";
        case ErrorCode::Protocol:         return "protocol";
        case ErrorCode::State:            return "state";
        case ErrorCode::Timeout:          return "timeout";
        case ErrorCode::InvalidArgument:  return "invalid_argument";
    }
    return "unknown";
}

// ============================================================================
// Error Severity
// ============================================================================

enum class ErrorSeverity : uint8_t {
    /// Caller may restart the operation from Select()
    Recoverable,
    /// Operation cannot succeed with the given inputs
    Fatal,
    /// Logged, operation continued (e.g. one skipped address during a scan)
    Warning
};

[[nodiscard]] constexpr const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Recoverable: return "RECOVERABLE";
        case ErrorSeverity::Fatal:       return "FATAL";
        case ErrorSeverity::Warning:     return "WARNING";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error Type
// ============================================================================

struct Error {
    ErrorCode code;
    SourceLocation location;
    ErrorSeverity severity;
    const char* message;           ///< static string, never owned

    [[nodiscard]] static constexpr Error Make(
        ErrorCode code,
        ErrorSeverity sev,
        const char* msg,
        SourceLocation loc = SourceLocation()) noexcept
    {
        return Error{code, loc, sev, msg};
    }

    [[nodiscard]] constexpr bool IsRecoverable() const noexcept {
        return severity == ErrorSeverity::Recoverable;
    }

    [[nodiscard]] constexpr bool IsFatal() const noexcept {
        return severity == ErrorSeverity::Fatal;
    }

    /// Log error with full context (file, line, function, message)
    void Log() const noexcept {
        const std::string_view file = location.FileName();
        OWBUS_LOG_ERROR(Device,
                        "[%s] %.*s:%d in %s() - code=%s (%s)",
                        ToString(severity),
                        static_cast<int>(file.size()), file.data(),
                        location.line,
                        location.function,
                        ToString(code),
                        message);
    }

    void LogAsWarning() const noexcept {
        const std::string_view file = location.FileName();
        OWBUS_LOG_WARNING(Device,
                          "[%s] %.*s:%d in %s() - code=%s (%s)",
                          ToString(severity),
                          static_cast<int>(file.size()), file.data(),
                          location.line,
                          location.function,
                          ToString(code),
                          message);
    }
};

static_assert(sizeof(Error) <= 64, "Error must stay cache-line friendly");

// ============================================================================
// Result Type
// ============================================================================

template<typename T>
using Result = std::expected<T, Error>;

// ============================================================================
// Error Creation Macros (with automatic source location)
// ============================================================================

#define OWBUS_ERROR_RECOVERABLE(code, msg) \
    std::unexpected(::OWBus::Error::Make((code), ::OWBus::ErrorSeverity::Recoverable, (msg)))

#define OWBUS_ERROR_FATAL(code, msg) \
    std::unexpected(::OWBus::Error::Make((code), ::OWBus::ErrorSeverity::Fatal, (msg)))

#define OWBUS_ERROR_TRANSPORT(msg) \
    OWBUS_ERROR_RECOVERABLE(::OWBus::ErrorCode::Transport, (msg))

#define OWBUS_ERROR_MALFORMED_ADDRESS(msg) \
    OWBUS_ERROR_FATAL(::OWBus::ErrorCode::MalformedAddress, (msg))

#define OWBUS_ERROR_PROTOCOL(msg) \
    OWBUS_ERROR_RECOVERABLE(::OWBus::ErrorCode::Protocol, (msg))

#define OWBUS_ERROR_STATE(msg) \
    OWBUS_ERROR_FATAL(::OWBus::ErrorCode::State, (msg))

#define OWBUS_ERROR_TIMEOUT(msg) \
    OWBUS_ERROR_RECOVERABLE(::OWBus::ErrorCode::Timeout, (msg))

#define OWBUS_ERROR_INVALID(msg) \
    OWBUS_ERROR_FATAL(::OWBus::ErrorCode::InvalidArgument, (msg))

// ============================================================================
// Error Propagation Helpers
// ============================================================================

/// Propagate error or extract value (GNU statement expression)
///
/// Usage:
///   Result<double> ReadTemperature() {
///       auto pad = OWBUS_TRY(ReadScratchpad());
///       return pad.temperature;
///   }
#define OWBUS_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Propagate error from a Result<void>
#define OWBUS_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (!_result) { \
            return std::unexpected(_result.error()); \
        } \
    } while (0)

} // namespace OWBus
