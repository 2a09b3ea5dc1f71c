#include "HexFormat.hpp"

#include <cstdio>

namespace OWBus::Hex {

namespace {

int NibbleValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string Dump(std::span<const uint8_t> data) {
    if (data.empty()) {
        return "<empty>";
    }
    std::string out;
    out.reserve(data.size() * 3);
    char buf[4];
    for (size_t i = 0; i < data.size(); ++i) {
        std::snprintf(buf, sizeof(buf), i == 0 ? "%02x" : " %02x", data[i]);
        out += buf;
    }
    return out;
}

std::string Pack(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(data.size() * 2);
    char buf[3];
    for (const uint8_t byte : data) {
        std::snprintf(buf, sizeof(buf), "%02x", byte);
        out += buf;
    }
    return out;
}

std::optional<uint8_t> ParseByte(std::string_view pair) {
    if (pair.size() != 2) {
        return std::nullopt;
    }
    const int hi = NibbleValue(pair[0]);
    const int lo = NibbleValue(pair[1]);
    if (hi < 0 || lo < 0) {
        return std::nullopt;
    }
    return static_cast<uint8_t>((hi << 4) | lo);
}

} // namespace OWBus::Hex
