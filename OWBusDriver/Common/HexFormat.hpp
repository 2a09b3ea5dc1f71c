#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace OWBus::Hex {

// "50 05 4b 46" style dump for log lines; empty input yields "<empty>".
std::string Dump(std::span<const uint8_t> data);

// Contiguous lowercase pairs, e.g. {0xAB, 0x01} -> "ab01".
std::string Pack(std::span<const uint8_t> data);

// Parses one two-character hex pair (either case).
std::optional<uint8_t> ParseByte(std::string_view pair);

} // namespace OWBus::Hex
