#include "EnvVars.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <strings.h>

namespace OWBus::Env {

std::optional<uint64_t> ReadUnsigned(const char* name) {
    const char* raw = std::getenv(name);
    // strtoull would skip whitespace and accept a sign; only bare digits pass.
    if (raw == nullptr || *raw < '0' || *raw > '9') {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
    const unsigned long long parsed = std::strtoull(raw, &end, 10);
    if (errno != 0 || end == raw || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(parsed);
}

std::optional<bool> ReadBool(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }

    if (std::strcmp(raw, "1") == 0 || strcasecmp(raw, "true") == 0 ||
        strcasecmp(raw, "yes") == 0 || strcasecmp(raw, "on") == 0) {
        return true;
    }
    if (std::strcmp(raw, "0") == 0 || strcasecmp(raw, "false") == 0 ||
        strcasecmp(raw, "no") == 0 || strcasecmp(raw, "off") == 0) {
        return false;
    }
    return std::nullopt;
}

} // namespace OWBus::Env
