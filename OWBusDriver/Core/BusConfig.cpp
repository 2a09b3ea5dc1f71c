#include "BusConfig.hpp"

#include <algorithm>

#include "../Common/EnvVars.hpp"
#include "../Logging/Logging.hpp"

namespace OWBus {

BusConfig BusConfig::MakeDefault() {
    BusConfig config;
    config.conversionTimeout = std::chrono::milliseconds{1000};
    config.verifyRomChecksum = true;
    config.verifyScratchpadCrc = false;
    return config;
}

BusConfig BusConfig::FromEnvironment() {
    BusConfig config = MakeDefault();

    if (const auto timeoutMs = Env::ReadUnsigned("OWBUS_CONVERSION_TIMEOUT_MS")) {
        const auto limit = static_cast<uint64_t>(kMaxConversionTimeout.count());
        if (*timeoutMs > limit) {
            OWBUS_LOG_WARNING(Config, "OWBUS_CONVERSION_TIMEOUT_MS=%llu exceeds %llu, clamping",
                              static_cast<unsigned long long>(*timeoutMs),
                              static_cast<unsigned long long>(limit));
        }
        config.conversionTimeout = std::chrono::milliseconds{static_cast<int64_t>(std::min(*timeoutMs, limit))};
    }
    if (const auto verifyRom = Env::ReadBool("OWBUS_VERIFY_ROM_CRC")) {
        config.verifyRomChecksum = *verifyRom;
    }
    if (const auto verifyPad = Env::ReadBool("OWBUS_VERIFY_SCRATCHPAD_CRC")) {
        config.verifyScratchpadCrc = *verifyPad;
    }

    OWBUS_LOG_INFO(Config, "BusConfig: conversionTimeout=%lldms verifyRomChecksum=%d verifyScratchpadCrc=%d",
                   static_cast<long long>(config.conversionTimeout.count()),
                   config.verifyRomChecksum, config.verifyScratchpadCrc);
    return config;
}

} // namespace OWBus
