#pragma once

#include "OWDevice.hpp"

namespace OWBus::Devices {

// Identification-only parts: ROM address and nothing else.

/// DS2401 silicon serial number (family 0x01).
class SerialNumber final : public OWDevice {
public:
    static constexpr uint8_t kFamily = Family::kSerialNumber;

    using OWDevice::OWDevice;

    const char* GetName() const override { return "SerialNumber"; }
};

/// DS1420 serial ID (family 0x81).
class SerialId final : public OWDevice {
public:
    static constexpr uint8_t kFamily = Family::kSerialId;

    using OWDevice::OWDevice;

    const char* GetName() const override { return "SerialId"; }
};

} // namespace OWBus::Devices
