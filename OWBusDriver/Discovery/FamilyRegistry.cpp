#include "FamilyRegistry.hpp"

#include <algorithm>

#include "../Devices/OWDevice.hpp"
#include "../Logging/Logging.hpp"

namespace OWBus::Discovery {

FamilyRegistry& FamilyRegistry::Shared() {
    static FamilyRegistry instance;
    return instance;
}

void FamilyRegistry::Register(uint8_t family, DeviceConstructor constructor) {
    if (constructors_[family] != nullptr && constructors_[family] != constructor) {
        OWBUS_LOG_V2(Discovery, "Family 0x%02x re-registered, replacing previous constructor", family);
    }
    constructors_[family] = constructor;
}

DeviceConstructor FamilyRegistry::Resolve(uint8_t family) const {
    if (const DeviceConstructor constructor = constructors_[family]) {
        return constructor;
    }
    return &Devices::MakeDevice<Devices::OWDevice>;
}

bool FamilyRegistry::IsRegistered(uint8_t family) const {
    return constructors_[family] != nullptr;
}

size_t FamilyRegistry::Size() const {
    return static_cast<size_t>(std::count_if(constructors_.begin(), constructors_.end(),
                                             [](DeviceConstructor c) { return c != nullptr; }));
}

void FamilyRegistry::Clear() {
    constructors_.fill(nullptr);
}

} // namespace OWBus::Discovery
