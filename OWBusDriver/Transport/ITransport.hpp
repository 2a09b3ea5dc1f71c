#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "../Common/OWCommon.hpp"
#include "../Core/Error.hpp"

namespace OWBus {

/**
 * @brief Physical 1-Wire master as seen by the protocol layer.
 *
 * Implementations own the adapter (USB bridge, UART master, bit-banged GPIO)
 * and perform every electrical-level step: reset pulses, bit/byte slots and
 * the search algorithm's arbitration. This layer only frames commands and
 * decodes the bytes that come back.
 *
 * There is one logical bus and no overlapping transactions: every call is a
 * complete request/response round trip. Implementations report bus faults and
 * short reads as ErrorCode::Transport.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Issue a bus reset and sample the presence pulse.
     */
    virtual Result<void> Reset() = 0;

    /**
     * @brief Write a frame and read back a fixed number of bytes.
     *
     * @param write       Bytes to put on the bus, in order
     * @param resetFirst  Issue a bus reset before the first byte
     * @param readLength  Number of bytes to read after the write (0 = none)
     * @return Exactly readLength bytes on success
     */
    virtual Result<Bytes> Transact(std::span<const uint8_t> write,
                                   bool resetFirst,
                                   size_t readLength) = 0;

    /**
     * @brief Read a single time slot (0 or 1).
     */
    virtual Result<uint8_t> ReadBit() = 0;

    /**
     * @brief Start a search pass and return the first ROM found.
     *
     * @param command kSearchRom or kCondSearchRom
     * @return Raw ROM bytes (normally 8), or nullopt when no device answered
     */
    virtual Result<std::optional<Bytes>> SearchFirst(uint8_t command) = 0;

    /**
     * @brief Continue the pass started by SearchFirst().
     *
     * @return Next raw ROM, or nullopt once the pass is exhausted. A finished
     *         pass is not restartable without a new SearchFirst().
     */
    virtual Result<std::optional<Bytes>> SearchNext() = 0;
};

} // namespace OWBus
