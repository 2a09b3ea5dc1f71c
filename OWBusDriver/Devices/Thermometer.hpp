// SPDX-License-Identifier: LGPL-3.0-or-later
//
// Thermometer.hpp - DS18B20 (family 0x28) scratchpad protocol
//
// Scratchpad layout (9 bytes, read with 0xBE):
//   [0-1] temperature, little-endian signed, 1/16 degC per LSB
//   [2]   TH alarm threshold (signed degC)
//   [3]   TL alarm threshold (signed degC)
//   [4]   configuration: bits 6:5 = resolution code (0 = 9-bit .. 3 = 12-bit)
//   [5-7] reserved
//   [8]   CRC-8 of bytes 0-7
//
// Reading cycle: Idle -> StartConversion() -> Converting -> ReadScratchpad() -> Ready

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "OWDevice.hpp"

namespace OWBus::Devices {

enum class Resolution : uint8_t {
    Bits9 = 0,
    Bits10 = 1,
    Bits11 = 2,
    Bits12 = 3,
};

[[nodiscard]] constexpr uint8_t ResolutionBits(Resolution resolution) noexcept {
    return static_cast<uint8_t>(9 + static_cast<uint8_t>(resolution));
}

enum class ConversionState : uint8_t {
    Idle,
    Converting,
    Ready,
};

[[nodiscard]] constexpr const char* ToString(ConversionState state) noexcept {
    switch (state) {
        case ConversionState::Idle:       return "Idle";
        case ConversionState::Converting: return "Converting";
        case ConversionState::Ready:      return "Ready";
    }
    return "Unknown";
}

struct ScratchpadReading {
    double temperature{0.0};
    int8_t alarmHigh{0};
    int8_t alarmLow{0};
    Resolution resolution{Resolution::Bits12};
};

class Thermometer final : public OWDevice {
public:
    static constexpr uint8_t kFamily = Family::kThermometer;
    static constexpr size_t kScratchpadLength = 9;
    static constexpr double kDegreesPerLsb = 0.0625;

    using OWDevice::OWDevice;

    /// Reads the scratchpad so alarms and resolution are cached.
    Result<void> InitializeState() override;

    const char* GetName() const override { return "Thermometer"; }

    /// Convert T to this device only. Idle/Ready -> Converting.
    Result<void> StartConversion();

    /**
     * @brief Read and decode the 9-byte scratchpad; updates every cached field.
     *
     * Fails with Protocol on a short reply, or on a CRC mismatch when
     * BusConfig::verifyScratchpadCrc is set. No partial decode is attempted.
     */
    Result<ScratchpadReading> ReadScratchpad();

    /**
     * @brief Temperature in degC.
     *
     * With convert set: StartConversion(), then poll the bus bit until the
     * device releases it (reads 1) or the bus's conversionTimeout elapses, then
     * ReadScratchpad(). A negative timeout is InvalidArgument; milliseconds::max()
     * never expires. Without convert: the value cached by the last scratchpad
     * read, or State if there was none.
     */
    Result<double> ReadTemperature(bool convert = true);
    Result<double> ReadTemperature(bool convert, std::chrono::milliseconds timeout);

    /**
     * @brief Write TH, TL and resolution; omitted values reuse the cached ones.
     *
     * Fails with State, without touching the bus, when an omitted value was
     * never read from the device.
     */
    Result<void> WriteScratchpad(std::optional<int8_t> alarmHigh = std::nullopt,
                                 std::optional<int8_t> alarmLow = std::nullopt,
                                 std::optional<Resolution> resolution = std::nullopt);

    Result<void> CopyScratchpad();
    Result<void> RecallEeprom();

    /// One byte; bit 0 reads 0 when the device runs on parasite power.
    Result<Bytes> ReadPowerSupply();

    ConversionState GetConversionState() const { return state_; }
    std::optional<double> LastTemperature() const { return lastTemperature_; }
    std::optional<int8_t> AlarmHigh() const { return alarmHigh_; }
    std::optional<int8_t> AlarmLow() const { return alarmLow_; }
    std::optional<Resolution> GetResolution() const { return resolution_; }

    // Pure codec helpers

    static ScratchpadReading DecodeScratchpad(std::span<const uint8_t, kScratchpadLength> scratchpad);

    // Masks the low bits that are undefined below 12-bit resolution, then scales.
    static double RawToCelsius(uint16_t raw, Resolution resolution);

    static Bytes EncodeWriteScratchpad(int8_t alarmHigh, int8_t alarmLow, Resolution resolution);

private:
    Result<void> SendSimple(uint8_t command);

    ConversionState state_{ConversionState::Idle};
    std::optional<double> lastTemperature_;
    std::optional<int8_t> alarmHigh_;
    std::optional<int8_t> alarmLow_;
    std::optional<Resolution> resolution_;
};

} // namespace OWBus::Devices
