#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "../Common/OWCommon.hpp"
#include "../Core/BusConfig.hpp"
#include "../Core/Error.hpp"
#include "../Transport/ITransport.hpp"
#include "FamilyRegistry.hpp"
#include "RomAddress.hpp"

namespace OWBus::Devices {
class OWDevice;
}

namespace OWBus::Discovery {

/**
 * @brief Owner of the bus: transport lifetime, discovery and broadcasts.
 *
 * Devices created here hold a non-owning reference back to the directory, so
 * the directory must outlive them. All calls are synchronous round trips on
 * the single transport; there is no locking because there is only ever one
 * call path active on a bus.
 *
 * Constructing the first directory seeds LogConfig from the environment.
 */
class BusDirectory {
public:
    using DeviceList = std::vector<std::unique_ptr<Devices::OWDevice>>;

    explicit BusDirectory(std::unique_ptr<ITransport> transport,
                          BusConfig config = BusConfig::MakeDefault());

    // Resolve families through a caller-owned registry instead of the shared one.
    BusDirectory(std::unique_ptr<ITransport> transport,
                 BusConfig config,
                 const FamilyRegistry& registry);

    ~BusDirectory();

    BusDirectory(const BusDirectory&) = delete;
    BusDirectory& operator=(const BusDirectory&) = delete;

    ITransport& Transport() const { return *transport_; }
    const BusConfig& Config() const { return config_; }

    /**
     * @brief Reset pulse; fails with Transport when nothing answers.
     */
    Result<void> ResetBus();

    /**
     * @brief One search pass, addresses only.
     *
     * Addresses that fail to parse (wrong length, or CRC-8 when
     * BusConfig::verifyRomChecksum is set) are logged and skipped.
     */
    Result<std::vector<RomAddress>> SearchAddresses(uint8_t searchCommand = Wire::kSearchRom);

    /**
     * @brief Search the bus and instantiate every device found.
     *
     * Each address is resolved through the family registry and its state is
     * initialized from the physical device. The search pass completes before
     * any device is addressed, so initialization traffic never interleaves
     * with the transport's search state.
     *
     * @param searchCommand kSearchRom (all devices) or kCondSearchRom (alarming only)
     */
    Result<DeviceList> Discover(uint8_t searchCommand = Wire::kSearchRom);

    /**
     * @brief Create the family-specific device for a known address.
     *
     * @param selected Initialize state from the device immediately
     */
    Result<std::unique_ptr<Devices::OWDevice>> Attach(const RomAddress& address, bool selected = false);

    /// Reset + Skip ROM: the next command reaches every device.
    Result<void> SkipRomBroadcast();

    /// Reset + Skip ROM + Convert T: every thermometer starts converting at once.
    /// Completion polling is left to the caller.
    Result<void> ConvertTBroadcast();

private:
    Result<void> Broadcast(std::span<const uint8_t> frame, const char* what);

    std::unique_ptr<ITransport> transport_;
    const BusConfig config_;
    const FamilyRegistry& registry_;
};

} // namespace OWBus::Discovery
