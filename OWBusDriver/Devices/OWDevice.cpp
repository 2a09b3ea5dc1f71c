#include "OWDevice.hpp"

#include "../Common/HexFormat.hpp"
#include "../Discovery/BusDirectory.hpp"
#include "../Logging/Logging.hpp"
#include "../Transport/ITransport.hpp"

namespace OWBus::Devices {

OWDevice::OWDevice(Discovery::BusDirectory& bus, const Discovery::RomAddress& address)
    : bus_(bus), address_(address) {}

std::string OWDevice::Describe() const {
    std::string out = "<";
    out += GetName();
    out += ' ';
    out += DisplayAddress();
    out += '>';
    return out;
}

ITransport& OWDevice::Transport() const {
    return bus_.Transport();
}

Result<Bytes> OWDevice::SelectAndSend(std::span<const uint8_t> command,
                                      size_t responseLength,
                                      bool reset) {
    const auto& rom = address_.Bytes();

    Bytes frame;
    frame.reserve(1 + rom.size() + command.size());
    frame.push_back(Wire::kMatchRom);
    frame.insert(frame.end(), rom.begin(), rom.end());
    frame.insert(frame.end(), command.begin(), command.end());

    OWBUS_LOG_HEX(Transport, "%s tx reset=%d rx=%zu: %s",
                  DisplayAddress().c_str(), reset, responseLength, Hex::Dump(frame).c_str());

    auto reply = Transport().Transact(frame, reset, responseLength);
    if (!reply) {
        OWBUS_LOG_V1(Device, "%s command 0x%02x failed: %s",
                     DisplayAddress().c_str(), command.empty() ? 0 : command[0], reply.error().message);
        return std::unexpected(reply.error());
    }

    if (reply->size() < responseLength) {
        OWBUS_LOG_V0(Device, "%s short reply to 0x%02x: got %zu of %zu bytes",
                     DisplayAddress().c_str(), command.empty() ? 0 : command[0],
                     reply->size(), responseLength);
        return OWBUS_ERROR_PROTOCOL("Device reply shorter than requested");
    }
    reply->resize(responseLength);

    if (responseLength > 0) {
        OWBUS_LOG_HEX(Transport, "%s rx: %s", DisplayAddress().c_str(), Hex::Dump(*reply).c_str());
    }
    return reply;
}

Result<void> OWDevice::Select() {
    auto reply = SelectAndSend({}, 0, true);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return {};
}

} // namespace OWBus::Devices
