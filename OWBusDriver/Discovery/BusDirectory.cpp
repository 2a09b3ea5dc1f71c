#include "BusDirectory.hpp"

#include <array>

#include "../Common/HexFormat.hpp"
#include "../Devices/DeviceFamilies.hpp"
#include "../Devices/OWDevice.hpp"
#include "../Logging/Logging.hpp"

namespace OWBus::Discovery {

namespace {

const FamilyRegistry& PopulatedSharedRegistry() {
    Devices::EnsureKnownFamiliesRegistered();
    return FamilyRegistry::Shared();
}

} // namespace

BusDirectory::BusDirectory(std::unique_ptr<ITransport> transport, BusConfig config)
    : BusDirectory(std::move(transport), config, PopulatedSharedRegistry()) {}

BusDirectory::BusDirectory(std::unique_ptr<ITransport> transport,
                           BusConfig config,
                           const FamilyRegistry& registry)
    : transport_(std::move(transport)),
      config_(config),
      registry_(registry) {
    LogConfig::Shared().Initialize();
    OWBUS_LOG_V1(Discovery, "Bus directory up: conversionTimeout=%lldms verifyRomChecksum=%d",
                 static_cast<long long>(config_.conversionTimeout.count()), config_.verifyRomChecksum);
}

BusDirectory::~BusDirectory() = default;

Result<void> BusDirectory::ResetBus() {
    auto result = transport_->Reset();
    if (!result) {
        OWBUS_LOG_V1(Discovery, "Bus reset failed: %s", result.error().message);
    }
    return result;
}

Result<std::vector<RomAddress>> BusDirectory::SearchAddresses(uint8_t searchCommand) {
    if (searchCommand != Wire::kSearchRom && searchCommand != Wire::kCondSearchRom) {
        return OWBUS_ERROR_INVALID("Search command must be Search ROM or Conditional Search ROM");
    }

    const auto policy = config_.verifyRomChecksum ? RomAddress::ChecksumPolicy::Enforce
                                                  : RomAddress::ChecksumPolicy::Permissive;

    std::vector<RomAddress> found;
    size_t skipped = 0;

    auto next = transport_->SearchFirst(searchCommand);
    while (true) {
        if (!next) {
            OWBUS_LOG_V0(Discovery, "Search 0x%02x aborted after %zu address(es): %s",
                         searchCommand, found.size(), next.error().message);
            return std::unexpected(next.error());
        }
        if (!next->has_value()) {
            break;
        }

        OWBUS_LOG_V4(Discovery, "Search raw: %s", Hex::Dump(**next).c_str());
        auto address = RomAddress::Parse(**next, policy);
        if (address) {
            OWBUS_LOG_V2(Discovery, "Search hit: %s", address->ToDisplay().c_str());
            found.push_back(*address);
        } else {
            ++skipped;
            address.error().LogAsWarning();
        }

        next = transport_->SearchNext();
    }

    OWBUS_LOG_V1(Discovery, "Search 0x%02x complete: %zu address(es), %zu skipped",
                 searchCommand, found.size(), skipped);
    return found;
}

Result<BusDirectory::DeviceList> BusDirectory::Discover(uint8_t searchCommand) {
    auto addresses = SearchAddresses(searchCommand);
    if (!addresses) {
        return std::unexpected(addresses.error());
    }

    DeviceList devices;
    devices.reserve(addresses->size());
    for (const RomAddress& address : *addresses) {
        auto device = Attach(address, true);
        if (!device) {
            return std::unexpected(device.error());
        }
        devices.push_back(std::move(*device));
    }
    return devices;
}

Result<std::unique_ptr<Devices::OWDevice>> BusDirectory::Attach(const RomAddress& address, bool selected) {
    const DeviceConstructor construct = registry_.Resolve(address.Family());
    std::unique_ptr<Devices::OWDevice> device = construct(*this, address);

    if (selected) {
        auto init = device->InitializeState();
        if (!init) {
            OWBUS_LOG_V0(Discovery, "%s state initialization failed: %s",
                         device->Describe().c_str(), init.error().message);
            return std::unexpected(init.error());
        }
    }

    OWBUS_LOG_V2(Discovery, "Attached %s (selected=%d)", device->Describe().c_str(), selected);
    return device;
}

Result<void> BusDirectory::SkipRomBroadcast() {
    const std::array<uint8_t, 1> frame = {Wire::kSkipRom};
    return Broadcast(frame, "skip rom");
}

Result<void> BusDirectory::ConvertTBroadcast() {
    const std::array<uint8_t, 2> frame = {Wire::kSkipRom, Wire::kConvertT};
    return Broadcast(frame, "convert t");
}

Result<void> BusDirectory::Broadcast(std::span<const uint8_t> frame, const char* what) {
    auto reply = transport_->Transact(frame, true, 0);
    if (!reply) {
        OWBUS_LOG_V0(Discovery, "Broadcast %s failed: %s", what, reply.error().message);
        return std::unexpected(reply.error());
    }
    OWBUS_LOG_HEX(Transport, "broadcast %s: %s", what, Hex::Dump(frame).c_str());
    OWBUS_LOG_V2(Discovery, "Broadcast %s sent", what);
    return {};
}

} // namespace OWBus::Discovery
