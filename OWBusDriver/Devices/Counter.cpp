// SPDX-License-Identifier: LGPL-3.0-or-later
//
// Counter.cpp - DS2423 memory and counter reads

#include "Counter.hpp"

#include <algorithm>

#include "../Logging/Logging.hpp"

namespace OWBus::Devices {

Result<Bytes> Counter::ReadMemory(uint16_t address, size_t length) {
    return SendAddressed(Wire::kReadMemory, address, length);
}

Result<Bytes> Counter::ReadMemoryAndCounter(uint16_t address, size_t length) {
    return SendAddressed(Wire::kReadMemoryAndCounter, address, length);
}

Result<CounterPage> Counter::ReadPageCounter(uint8_t page) {
    if (page >= kPageCount) {
        return OWBUS_ERROR_INVALID("Counter page out of range (0-15)");
    }
    const auto address = static_cast<uint16_t>(page * kPageSize);
    const Bytes raw = OWBUS_TRY(ReadMemoryAndCounter(address, kDefaultCounterLength));
    const CounterPage decoded = OWBUS_TRY(DecodeCounterPage(raw));
    OWBUS_LOG_V2(Device, "%s page %u counter=%u", DisplayAddress().c_str(), page, decoded.counter);
    return decoded;
}

Result<CounterPage> Counter::DecodeCounterPage(std::span<const uint8_t> raw) {
    if (raw.size() < kPageSize + sizeof(uint32_t)) {
        return OWBUS_ERROR_PROTOCOL("Counter page reply shorter than 36 bytes");
    }

    CounterPage page;
    std::copy_n(raw.begin(), kPageSize, page.data.begin());
    page.counter = static_cast<uint32_t>(raw[kPageSize]) |
                   (static_cast<uint32_t>(raw[kPageSize + 1]) << 8) |
                   (static_cast<uint32_t>(raw[kPageSize + 2]) << 16) |
                   (static_cast<uint32_t>(raw[kPageSize + 3]) << 24);
    return page;
}

Result<Bytes> Counter::SendAddressed(uint8_t command, uint16_t address, size_t length) {
    // Target address goes out low byte first.
    const std::array<uint8_t, 3> frame = {
        command,
        static_cast<uint8_t>(address & 0xFF),
        static_cast<uint8_t>((address >> 8) & 0xFF),
    };
    OWBUS_LOG_V3(Device, "%s cmd 0x%02x @0x%04x len=%zu", DisplayAddress().c_str(), command, address, length);
    return SelectAndSend(frame, length);
}

} // namespace OWBus::Devices
