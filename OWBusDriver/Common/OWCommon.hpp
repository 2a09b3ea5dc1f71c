#pragma once

#include <cstdint>
#include <vector>

namespace OWBus {

using Bytes = std::vector<uint8_t>;

namespace Wire {

// ============================================================================
// ROM Function Commands (bus-level addressing)
// ============================================================================

inline constexpr uint8_t kReadRom = 0x33;
inline constexpr uint8_t kMatchRom = 0x55;
inline constexpr uint8_t kSkipRom = 0xCC;
inline constexpr uint8_t kSearchRom = 0xF0;
inline constexpr uint8_t kCondSearchRom = 0xEC;  // only devices in an alarm state answer

// ============================================================================
// Thermometer Function Commands (DS18B20)
// ============================================================================

inline constexpr uint8_t kConvertT = 0x44;
inline constexpr uint8_t kWriteScratchpad = 0x4E;
inline constexpr uint8_t kReadScratchpad = 0xBE;
inline constexpr uint8_t kCopyScratchpad = 0x48;
inline constexpr uint8_t kRecallEeprom = 0xB8;
inline constexpr uint8_t kReadPowerSupply = 0xB4;

// ============================================================================
// Memory Function Commands (DS2423 counter)
// ============================================================================

// Same byte as kSearchRom; the two never share a frame position.
inline constexpr uint8_t kReadMemory = 0xF0;
inline constexpr uint8_t kReadMemoryAndCounter = 0xA5;

} // namespace Wire

// ============================================================================
// Family Codes (first ROM byte)
// ============================================================================

namespace Family {

inline constexpr uint8_t kSerialNumber = 0x01;
inline constexpr uint8_t kSerialId = 0x81;
inline constexpr uint8_t kThermometer = 0x28;
inline constexpr uint8_t kCounter = 0x1D;
inline constexpr uint8_t kAddressableSwitch = 0x05;

} // namespace Family

} // namespace OWBus
