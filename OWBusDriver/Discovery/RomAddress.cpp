#include "RomAddress.hpp"

#include <algorithm>

#include "../Common/Crc8.hpp"
#include "../Common/HexFormat.hpp"

namespace OWBus::Discovery {

namespace {

// "cc" + "." + 12 serial digits + "." + "ff"
constexpr size_t kDisplayLength = 2 + 1 + RomAddress::kSerialLength * 2 + 1 + 2;

} // namespace

Result<RomAddress> RomAddress::Parse(std::span<const uint8_t> raw, ChecksumPolicy policy) {
    if (raw.size() != kLength) {
        OWBUS_LOG_V2(Discovery, "ROM parse rejected: %zu bytes (need %zu)", raw.size(), kLength);
        return OWBUS_ERROR_MALFORMED_ADDRESS("ROM address must be exactly 8 bytes");
    }

    std::array<uint8_t, kLength> bytes{};
    std::copy(raw.begin(), raw.end(), bytes.begin());
    RomAddress address(bytes);

    if (policy == ChecksumPolicy::Enforce && !address.HasValidChecksum()) {
        OWBUS_LOG_V1(Discovery, "ROM %s fails CRC-8 (computed=0x%02x)",
                     address.ToDisplay().c_str(), Crc8(raw.first(kLength - 1)));
        return OWBUS_ERROR_MALFORMED_ADDRESS("ROM address checksum mismatch");
    }
    return address;
}

Result<RomAddress> RomAddress::FromDisplayString(std::string_view text) {
    if (text.size() != kDisplayLength || text[2] != '.' || text[kDisplayLength - 3] != '.') {
        return OWBUS_ERROR_MALFORMED_ADDRESS("ROM display string must look like cc.ssssssssssss.ff");
    }

    const auto checksum = Hex::ParseByte(text.substr(0, 2));
    const auto family = Hex::ParseByte(text.substr(kDisplayLength - 2, 2));
    if (!checksum || !family) {
        return OWBUS_ERROR_MALFORMED_ADDRESS("ROM display string has non-hex family or checksum");
    }

    std::array<uint8_t, kLength> bytes{};
    bytes[0] = *family;
    bytes[7] = *checksum;

    // Display order is MSB first; wire order puts the MSB at bytes[6].
    const std::string_view serial = text.substr(3, kSerialLength * 2);
    for (size_t i = 0; i < kSerialLength; ++i) {
        const auto value = Hex::ParseByte(serial.substr(i * 2, 2));
        if (!value) {
            return OWBUS_ERROR_MALFORMED_ADDRESS("ROM display string has non-hex serial");
        }
        bytes[kSerialLength - i] = *value;
    }
    return RomAddress(bytes);
}

std::array<uint8_t, RomAddress::kSerialLength> RomAddress::Serial() const {
    std::array<uint8_t, kSerialLength> serial{};
    std::copy(bytes_.begin() + 1, bytes_.begin() + 1 + kSerialLength, serial.begin());
    return serial;
}

uint64_t RomAddress::ToUInt64() const {
    uint64_t value = 0;
    for (size_t i = 0; i < kLength; ++i) {
        value |= static_cast<uint64_t>(bytes_[i]) << (8 * i);
    }
    return value;
}

bool RomAddress::HasValidChecksum() const {
    return Crc8Valid(bytes_);
}

std::string RomAddress::ToDisplay() const {
    std::array<uint8_t, kSerialLength> reversed = Serial();
    std::reverse(reversed.begin(), reversed.end());

    std::string out;
    out.reserve(kDisplayLength);
    out += Hex::Pack(std::span<const uint8_t>(&bytes_[7], 1));
    out += '.';
    out += Hex::Pack(reversed);
    out += '.';
    out += Hex::Pack(std::span<const uint8_t>(&bytes_[0], 1));
    return out;
}

} // namespace OWBus::Discovery
