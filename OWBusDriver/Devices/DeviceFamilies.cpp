#include "DeviceFamilies.hpp"

#include <array>
#include <mutex>

#include "AddressableSwitch.hpp"
#include "Counter.hpp"
#include "SerialNumber.hpp"
#include "Thermometer.hpp"
#include "../Logging/Logging.hpp"

namespace OWBus::Devices {

namespace {

constexpr std::array<FamilyEntry, 5> kFamilies = {{
    {SerialNumber::kFamily,     "SerialNumber",     &MakeDevice<SerialNumber>},
    {AddressableSwitch::kFamily, "AddressableSwitch", &MakeDevice<AddressableSwitch>},
    {Counter::kFamily,          "Counter",          &MakeDevice<Counter>},
    {Thermometer::kFamily,      "Thermometer",      &MakeDevice<Thermometer>},
    {SerialId::kFamily,         "SerialId",         &MakeDevice<SerialId>},
}};

} // namespace

std::span<const FamilyEntry> KnownFamilies() {
    return kFamilies;
}

void RegisterKnownFamilies(Discovery::FamilyRegistry& registry) {
    for (const FamilyEntry& entry : kFamilies) {
        registry.Register(entry.family, entry.construct);
    }
    OWBUS_LOG_V2(Discovery, "Registered %zu device families", kFamilies.size());
}

void EnsureKnownFamiliesRegistered() {
    static std::once_flag once;
    std::call_once(once, [] { RegisterKnownFamilies(Discovery::FamilyRegistry::Shared()); });
}

} // namespace OWBus::Devices
