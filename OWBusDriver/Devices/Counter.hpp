// SPDX-License-Identifier: LGPL-3.0-or-later
//
// Counter.hpp - DS2423 4 KiB RAM with counters (family 0x1D)
//
// Memory map: 16 pages of 32 bytes. Pages 12-15 each carry a 32-bit counter
// (pages 14 and 15 count the external inputs A and B). Read Memory + Counter
// (0xA5) returns the rest of the page, the page's counter (little-endian),
// four zero bytes and a CRC-16, which this layer passes through untouched.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "OWDevice.hpp"

namespace OWBus::Devices {

struct CounterPage {
    std::array<uint8_t, 32> data{};
    uint32_t counter{0};
};

class Counter final : public OWDevice {
public:
    static constexpr uint8_t kFamily = Family::kCounter;
    static constexpr size_t kPageSize = 32;
    static constexpr uint8_t kPageCount = 16;

    // Page 14 (counter A) and the byte count of a full page + counter + zeros + CRC-16.
    static constexpr uint16_t kDefaultCounterAddress = 0x01C0;
    static constexpr size_t kDefaultCounterLength = 42;

    using OWDevice::OWDevice;

    const char* GetName() const override { return "Counter"; }

    /// Read Memory (0xF0) from a 16-bit target address.
    Result<Bytes> ReadMemory(uint16_t address, size_t length);

    /// Read Memory + Counter (0xA5). The raw reply is returned as-is.
    Result<Bytes> ReadMemoryAndCounter(uint16_t address = kDefaultCounterAddress,
                                       size_t length = kDefaultCounterLength);

    /// Full page read starting at page * 32, decoded.
    Result<CounterPage> ReadPageCounter(uint8_t page);

    /// 32 data bytes followed by the little-endian counter; Protocol when shorter.
    static Result<CounterPage> DecodeCounterPage(std::span<const uint8_t> raw);

private:
    Result<Bytes> SendAddressed(uint8_t command, uint16_t address, size_t length);
};

} // namespace OWBus::Devices
