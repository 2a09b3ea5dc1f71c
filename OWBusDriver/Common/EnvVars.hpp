#pragma once

#include <cstdint>
#include <optional>

namespace OWBus::Env {

// Both helpers return nullopt when the variable is unset, empty or unparsable.

// Decimal unsigned integer; must start with a digit and fit in 64 bits.
std::optional<uint64_t> ReadUnsigned(const char* name);

// Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
std::optional<bool> ReadBool(const char* name);

} // namespace OWBus::Env
