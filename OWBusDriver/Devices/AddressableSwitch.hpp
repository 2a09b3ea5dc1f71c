#pragma once

#include <cstdint>
#include <optional>

#include "OWDevice.hpp"

namespace OWBus::Devices {

/**
 * @brief DS2405 addressable switch (family 0x05).
 *
 * The part has no function commands: a Match ROM alone toggles the PIO, and a
 * bit read right after the match reports the output state (0 = pulled low = on).
 * The cached state therefore only stays correct while this object is the only
 * thing selecting the device.
 */
class AddressableSwitch final : public OWDevice {
public:
    static constexpr uint8_t kFamily = Family::kAddressableSwitch;

    using OWDevice::OWDevice;

    /// Runs ReadState(). The select toggles the output once; the cache records
    /// the state after the toggle.
    Result<void> InitializeState() override;

    const char* GetName() const override { return "AddressableSwitch"; }

    // Select + one bit read. Note that the selection itself toggles the PIO;
    // the bit read reflects the state after the toggle.
    Result<bool> ReadState();

    /// Cached state; State error before the first read.
    Result<bool> IsOn() const;

    Result<void> Toggle();

    // Only toggle when the cached state differs.
    Result<void> TurnOn();
    Result<void> TurnOff();

private:
    Result<void> Drive(bool wantOn);

    std::optional<bool> on_;
};

} // namespace OWBus::Devices
