#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "RomAddress.hpp"

namespace OWBus::Devices {
class OWDevice;
}

namespace OWBus::Discovery {

class BusDirectory;

/// Creates the concrete device for an address. Construction never touches the
/// bus; state is read afterwards through OWDevice::InitializeState().
using DeviceConstructor = std::unique_ptr<Devices::OWDevice> (*)(BusDirectory& bus,
                                                                const RomAddress& address);

// Family byte -> device constructor table.
// The process-wide instance is filled once from Devices::KnownFamilies() before
// the first discovery and is read-only afterwards.
class FamilyRegistry {
public:
    FamilyRegistry() = default;

    static FamilyRegistry& Shared();

    // Last registration for a family wins.
    void Register(uint8_t family, DeviceConstructor constructor);

    // Never null: unknown families resolve to the generic OWDevice constructor.
    DeviceConstructor Resolve(uint8_t family) const;

    bool IsRegistered(uint8_t family) const;
    size_t Size() const;

    void Clear();

private:
    std::array<DeviceConstructor, 256> constructors_{};
};

} // namespace OWBus::Discovery
