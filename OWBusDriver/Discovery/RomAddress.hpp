#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "../Core/Error.hpp"

namespace OWBus::Discovery {

/**
 * @brief 8-byte 1-Wire ROM identifier: family, 48-bit serial, CRC-8.
 *
 * Wire order is [family][serial0 (LSB) .. serial5 (MSB)][crc]. Immutable once
 * parsed; copies are cheap.
 */
class RomAddress {
public:
    static constexpr size_t kLength = 8;
    static constexpr size_t kSerialLength = 6;

    enum class ChecksumPolicy : uint8_t {
        Permissive,  // accept any checksum byte
        Enforce,     // reject unless byte 7 is the CRC-8 of bytes 0-6
    };

    /**
     * @brief Build an address from raw transport bytes.
     * @return MalformedAddress when raw is not exactly 8 bytes, or when the
     *         policy is Enforce and the checksum does not match
     */
    static Result<RomAddress> Parse(std::span<const uint8_t> raw,
                                    ChecksumPolicy policy = ChecksumPolicy::Permissive);

    /**
     * @brief Inverse of ToDisplay(): "<crc>.<serial msb-first>.<family>".
     *
     * Hex digits may be either case. The checksum is not verified.
     */
    static Result<RomAddress> FromDisplayString(std::string_view text);

    uint8_t Family() const { return bytes_[0]; }
    uint8_t Checksum() const { return bytes_[7]; }

    /// Serial bytes in wire order (least significant first)
    std::array<uint8_t, kSerialLength> Serial() const;

    const std::array<uint8_t, kLength>& Bytes() const { return bytes_; }

    /// Wire bytes packed little-endian: family in bits 0-7, checksum in bits 56-63
    uint64_t ToUInt64() const;

    bool HasValidChecksum() const;

    /**
     * @brief Canonical form "<checksum>.<serial>.<family>", lowercase hex.
     *
     * The serial is rendered most-significant byte first, the reverse of wire
     * order; address books keyed on this string depend on the reversal.
     * Example: 28 11 22 33 44 55 66 56 -> "56.665544332211.28"
     */
    std::string ToDisplay() const;

    bool operator==(const RomAddress&) const = default;

private:
    explicit RomAddress(const std::array<uint8_t, kLength>& bytes) : bytes_(bytes) {}

    std::array<uint8_t, kLength> bytes_;
};

} // namespace OWBus::Discovery
