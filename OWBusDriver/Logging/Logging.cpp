// System logger shim. The library never calls openlog(): ident and facility
// belong to the host process. Categories are carried as message prefixes by
// the OWBUS_LOG macros.
#include "Logging.hpp"
#include "LogConfig.hpp"

#include <cstdarg>
#include <cstdio>

namespace OWBus::Logging {

const Category& Discovery() { static const Category cat{"discovery"}; return cat; }
const Category& Device()    { static const Category cat{"device"};    return cat; }
const Category& Transport() { static const Category cat{"transport"}; return cat; }
const Category& Config()    { static const Category cat{"config"};    return cat; }

void Write(const Category& category, int priority, const char* fmt, ...) {
    (void)category;

    va_list args;
    va_start(args, fmt);
    if (LogConfig::Shared().IsStderrMirrorEnabled()) {
        va_list copy;
        va_copy(copy, args);
        std::vfprintf(stderr, fmt, copy);
        std::fputc('\n', stderr);
        va_end(copy);
    }
    vsyslog(priority, fmt, args);
    va_end(args);
}

} // namespace OWBus::Logging
