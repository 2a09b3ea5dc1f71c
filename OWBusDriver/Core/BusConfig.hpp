#pragma once

#include <chrono>
#include <cstdint>

namespace OWBus {

// Immutable settings handed to a BusDirectory at construction; every device
// created through that directory reads them from there.
struct BusConfig {
    // Upper bound for the conversion-complete poll in Thermometer::ReadTemperature.
    // A DS18B20 needs at most 750 ms at 12-bit resolution.
    std::chrono::milliseconds conversionTimeout{1000};

    // Environment values above this are clamped to it.
    static constexpr std::chrono::milliseconds kMaxConversionTimeout{60000};

    // Reject discovered ROM addresses whose last byte is not the CRC-8 of the
    // first seven. Rejected addresses are logged and skipped.
    bool verifyRomChecksum{true};

    // Check byte 8 of every scratchpad read against the CRC-8 of bytes 0-7.
    bool verifyScratchpadCrc{false};

    static BusConfig MakeDefault();

    // MakeDefault() overridden by OWBUS_CONVERSION_TIMEOUT_MS (clamped to
    // kMaxConversionTimeout),
    // OWBUS_VERIFY_ROM_CRC and OWBUS_VERIFY_SCRATCHPAD_CRC when set.
    static BusConfig FromEnvironment();
};

} // namespace OWBus
