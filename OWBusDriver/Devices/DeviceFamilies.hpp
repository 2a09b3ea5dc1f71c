#pragma once

#include <cstdint>
#include <span>

#include "../Discovery/FamilyRegistry.hpp"

namespace OWBus::Devices {

struct FamilyEntry {
    uint8_t family;
    const char* name;
    Discovery::DeviceConstructor construct;
};

/// Every family this library implements, in ascending family-code order.
std::span<const FamilyEntry> KnownFamilies();

void RegisterKnownFamilies(Discovery::FamilyRegistry& registry);

/// Fill FamilyRegistry::Shared() once per process. Later calls are no-ops, so
/// registrations made by the application after the first call are kept.
void EnsureKnownFamiliesRegistered();

} // namespace OWBus::Devices
