#include "AddressableSwitch.hpp"

#include "../Logging/Logging.hpp"
#include "../Transport/ITransport.hpp"

namespace OWBus::Devices {

Result<void> AddressableSwitch::InitializeState() {
    auto state = ReadState();
    if (!state) {
        return std::unexpected(state.error());
    }
    return {};
}

Result<bool> AddressableSwitch::ReadState() {
    OWBUS_TRY_VOID(Select());
    const uint8_t bit = OWBUS_TRY(Transport().ReadBit());
    on_ = (bit == 0);
    OWBUS_LOG_V2(Device, "%s output %s", DisplayAddress().c_str(), *on_ ? "on" : "off");
    return *on_;
}

Result<bool> AddressableSwitch::IsOn() const {
    if (!on_) {
        return OWBUS_ERROR_STATE("Switch state never read");
    }
    return *on_;
}

Result<void> AddressableSwitch::Toggle() {
    if (!on_) {
        return OWBUS_ERROR_STATE("Cannot toggle a switch with unknown state");
    }
    OWBUS_TRY_VOID(Select());
    on_ = !*on_;
    OWBUS_LOG_V2(Device, "%s toggled -> %s", DisplayAddress().c_str(), *on_ ? "on" : "off");
    return {};
}

Result<void> AddressableSwitch::TurnOn() {
    return Drive(true);
}

Result<void> AddressableSwitch::TurnOff() {
    return Drive(false);
}

Result<void> AddressableSwitch::Drive(bool wantOn) {
    const bool current = OWBUS_TRY(IsOn());
    if (current == wantOn) {
        return {};
    }
    return Toggle();
}

} // namespace OWBus::Devices
