#pragma once

#include <cstdint>
#include <span>

namespace OWBus {

// Dallas/Maxim CRC-8: polynomial x^8 + x^5 + x^4 + 1, LSB first, init 0.
// Protects the ROM address (over 7 bytes) and the DS18B20 scratchpad (over 8 bytes).
inline constexpr uint8_t kCrc8ReflectedPolynomial = 0x8C;

[[nodiscard]] constexpr uint8_t Crc8Step(uint8_t crc, uint8_t data) noexcept {
    for (int bit = 0; bit < 8; ++bit) {
        const bool mix = ((crc ^ data) & 0x01u) != 0;
        crc = static_cast<uint8_t>(crc >> 1);
        if (mix) {
            crc = static_cast<uint8_t>(crc ^ kCrc8ReflectedPolynomial);
        }
        data = static_cast<uint8_t>(data >> 1);
    }
    return crc;
}

[[nodiscard]] uint8_t Crc8(std::span<const uint8_t> data) noexcept;

// True when the last byte equals the CRC-8 of everything before it.
// An empty span is never valid.
[[nodiscard]] bool Crc8Valid(std::span<const uint8_t> dataWithCrc) noexcept;

} // namespace OWBus
