#include "Crc8.hpp"

namespace OWBus {

uint8_t Crc8(std::span<const uint8_t> data) noexcept {
    uint8_t crc = 0;
    for (const uint8_t byte : data) {
        crc = Crc8Step(crc, byte);
    }
    return crc;
}

bool Crc8Valid(std::span<const uint8_t> dataWithCrc) noexcept {
    if (dataWithCrc.empty()) {
        return false;
    }
    return Crc8(dataWithCrc.first(dataWithCrc.size() - 1)) == dataWithCrc.back();
}

} // namespace OWBus
