#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "../Common/OWCommon.hpp"
#include "../Core/Error.hpp"
#include "../Discovery/RomAddress.hpp"

namespace OWBus {
class ITransport;
}

namespace OWBus::Discovery {
class BusDirectory;
}

namespace OWBus::Devices {

/**
 * @brief One addressed unit on the bus.
 *
 * Every family-specific command goes through SelectAndSend(), which prefixes
 * Match ROM + this device's address so a command can never reach a sibling.
 * The bus directory is shared and outlives its devices; a device never owns it.
 *
 * Lifecycle:
 * - Discovered: BusDirectory constructs the resolved family type and calls
 *   InitializeState() before handing it out.
 * - Attached manually: state stays unset until the first explicit read.
 */
class OWDevice {
public:
    OWDevice(Discovery::BusDirectory& bus, const Discovery::RomAddress& address);
    virtual ~OWDevice() = default;

    OWDevice(const OWDevice&) = delete;
    OWDevice& operator=(const OWDevice&) = delete;

    /**
     * @brief Snapshot the physical device's state at discovery time.
     *
     * Families without discovery-time state keep this no-op.
     */
    virtual Result<void> InitializeState() { return {}; }

    virtual const char* GetName() const { return "OWDevice"; }

    const Discovery::RomAddress& GetAddress() const { return address_; }
    uint8_t GetFamily() const { return address_.Family(); }

    std::string DisplayAddress() const { return address_.ToDisplay(); }

    /// "<Thermometer 56.665544332211.28>"
    std::string Describe() const;

    /**
     * @brief Send Match ROM + address + command and read the reply.
     *
     * @param command         Function command and its parameter bytes
     * @param responseLength  Bytes expected back (0 = none)
     * @param reset           Reset the bus before the frame
     * @return Exactly responseLength bytes; Protocol error when the transport
     *         hands back fewer
     */
    Result<Bytes> SelectAndSend(std::span<const uint8_t> command,
                                size_t responseLength = 0,
                                bool reset = true);

    /**
     * @brief Reset + Match ROM with no command, leaving this device as the
     *        only participant in following bit-level operations.
     */
    Result<void> Select();

protected:
    Discovery::BusDirectory& Bus() const { return bus_; }
    ITransport& Transport() const;

private:
    Discovery::BusDirectory& bus_;
    const Discovery::RomAddress address_;
};

template<typename T>
std::unique_ptr<OWDevice> MakeDevice(Discovery::BusDirectory& bus, const Discovery::RomAddress& address) {
    return std::make_unique<T>(bus, address);
}

} // namespace OWBus::Devices
