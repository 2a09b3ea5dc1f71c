// SPDX-License-Identifier: LGPL-3.0-or-later
//
// Thermometer.cpp - DS18B20 scratchpad protocol

#include "Thermometer.hpp"

#include <array>

#include "../Common/Crc8.hpp"
#include "../Common/HexFormat.hpp"
#include "../Discovery/BusDirectory.hpp"
#include "../Logging/Logging.hpp"
#include "../Transport/ITransport.hpp"

namespace OWBus::Devices {

namespace {

constexpr uint16_t kResolutionMaskBase = 0xFFFC;
constexpr uint8_t kResolutionShift = 5;
constexpr uint8_t kResolutionCodeMask = 0x03;
constexpr uint8_t kConfigWriteMask = 0x7F;

// now + timeout, saturating at time_point::max() (milliseconds::max() waits forever).
std::chrono::steady_clock::time_point ConversionDeadline(std::chrono::steady_clock::time_point now,
                                                         std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom) {
        return Clock::time_point::max();
    }
    return now + timeout;
}

} // namespace

Result<void> Thermometer::InitializeState() {
    auto reading = ReadScratchpad();
    if (!reading) {
        return std::unexpected(reading.error());
    }
    return {};
}

Result<void> Thermometer::StartConversion() {
    OWBUS_TRY_VOID(SendSimple(Wire::kConvertT));
    OWBUS_LOG_V2(Device, "%s %s -> Converting", DisplayAddress().c_str(), ToString(state_));
    state_ = ConversionState::Converting;
    return {};
}

Result<ScratchpadReading> Thermometer::ReadScratchpad() {
    const std::array<uint8_t, 1> command = {Wire::kReadScratchpad};
    const Bytes raw = OWBUS_TRY(SelectAndSend(command, kScratchpadLength));

    if (Bus().Config().verifyScratchpadCrc && !Crc8Valid(raw)) {
        OWBUS_LOG_V0(Device, "%s scratchpad CRC mismatch: %s",
                     DisplayAddress().c_str(), Hex::Dump(raw).c_str());
        return OWBUS_ERROR_PROTOCOL("Scratchpad CRC-8 mismatch");
    }

    const ScratchpadReading reading =
        DecodeScratchpad(std::span<const uint8_t, kScratchpadLength>(raw.data(), kScratchpadLength));

    lastTemperature_ = reading.temperature;
    alarmHigh_ = reading.alarmHigh;
    alarmLow_ = reading.alarmLow;
    resolution_ = reading.resolution;
    state_ = ConversionState::Ready;

    OWBUS_LOG_V3(Device, "%s scratchpad: t=%.4f th=%d tl=%d res=%u-bit",
                 DisplayAddress().c_str(), reading.temperature, reading.alarmHigh,
                 reading.alarmLow, ResolutionBits(reading.resolution));
    return reading;
}

Result<double> Thermometer::ReadTemperature(bool convert) {
    return ReadTemperature(convert, Bus().Config().conversionTimeout);
}

Result<double> Thermometer::ReadTemperature(bool convert, std::chrono::milliseconds timeout) {
    if (!convert) {
        if (!lastTemperature_) {
            return OWBUS_ERROR_STATE("No scratchpad read yet; temperature unknown");
        }
        return *lastTemperature_;
    }

    if (timeout.count() < 0) {
        return OWBUS_ERROR_INVALID("Conversion timeout must not be negative");
    }

    OWBUS_TRY_VOID(StartConversion());

    // Open-drain completion signal: the device holds the line low while converting.
    const auto deadline = ConversionDeadline(std::chrono::steady_clock::now(), timeout);
    uint32_t polls = 0;
    while (true) {
        const uint8_t bit = OWBUS_TRY(Transport().ReadBit());
        ++polls;
        if (bit != 0) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            OWBUS_LOG_V0(Device, "%s conversion not done after %lld ms (%u polls)",
                         DisplayAddress().c_str(), static_cast<long long>(timeout.count()), polls);
            return OWBUS_ERROR_TIMEOUT("Temperature conversion did not complete in time");
        }
        OWBUS_LOG_RL(Device, "therm/poll", 250, LOG_DEBUG, "%s still converting (%u polls)",
                     DisplayAddress().c_str(), polls);
    }

    const ScratchpadReading reading = OWBUS_TRY(ReadScratchpad());
    return reading.temperature;
}

Result<void> Thermometer::WriteScratchpad(std::optional<int8_t> alarmHigh,
                                          std::optional<int8_t> alarmLow,
                                          std::optional<Resolution> resolution) {
    if (!alarmHigh) alarmHigh = alarmHigh_;
    if (!alarmLow) alarmLow = alarmLow_;
    if (!resolution) resolution = resolution_;

    if (!alarmHigh || !alarmLow || !resolution) {
        return OWBUS_ERROR_STATE("Write scratchpad needs a prior read for omitted values");
    }
    if (static_cast<uint8_t>(*resolution) > static_cast<uint8_t>(Resolution::Bits12)) {
        return OWBUS_ERROR_INVALID("Resolution code out of range");
    }

    const Bytes command = EncodeWriteScratchpad(*alarmHigh, *alarmLow, *resolution);
    OWBUS_TRY(SelectAndSend(command, 0));

    alarmHigh_ = alarmHigh;
    alarmLow_ = alarmLow;
    resolution_ = resolution;
    OWBUS_LOG_V2(Device, "%s wrote th=%d tl=%d res=%u-bit", DisplayAddress().c_str(),
                 *alarmHigh, *alarmLow, ResolutionBits(*resolution));
    return {};
}

Result<void> Thermometer::CopyScratchpad() {
    return SendSimple(Wire::kCopyScratchpad);
}

Result<void> Thermometer::RecallEeprom() {
    return SendSimple(Wire::kRecallEeprom);
}

Result<Bytes> Thermometer::ReadPowerSupply() {
    const std::array<uint8_t, 1> command = {Wire::kReadPowerSupply};
    return SelectAndSend(command, 1);
}

Result<void> Thermometer::SendSimple(uint8_t command) {
    const std::array<uint8_t, 1> frame = {command};
    OWBUS_TRY(SelectAndSend(frame, 0));
    return {};
}

ScratchpadReading Thermometer::DecodeScratchpad(std::span<const uint8_t, kScratchpadLength> scratchpad) {
    ScratchpadReading reading;
    reading.resolution = static_cast<Resolution>((scratchpad[4] >> kResolutionShift) & kResolutionCodeMask);
    reading.alarmLow = static_cast<int8_t>(scratchpad[3]);
    reading.alarmHigh = static_cast<int8_t>(scratchpad[2]);

    const uint16_t raw = static_cast<uint16_t>(scratchpad[0] | (scratchpad[1] << 8));
    reading.temperature = RawToCelsius(raw, reading.resolution);
    return reading;
}

double Thermometer::RawToCelsius(uint16_t raw, Resolution resolution) {
    const uint16_t mask = static_cast<uint16_t>(kResolutionMaskBase | static_cast<uint8_t>(resolution));
    const int16_t masked = static_cast<int16_t>(raw & mask);
    return masked * kDegreesPerLsb;
}

Bytes Thermometer::EncodeWriteScratchpad(int8_t alarmHigh, int8_t alarmLow, Resolution resolution) {
    return Bytes{
        Wire::kWriteScratchpad,
        static_cast<uint8_t>(alarmHigh),
        static_cast<uint8_t>(alarmLow),
        static_cast<uint8_t>((static_cast<uint8_t>(resolution) << kResolutionShift) & kConfigWriteMask),
    };
}

} // namespace OWBus::Devices
