/**
 * @file Trace.cpp
 * @brief Environment-gated stderr tracing
 */

#include <CircFit/Platform/Trace.h>

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace Circ::Fit::Platform {

bool IsTraceEnabled() {
#ifdef CIRCFIT_DEBUG
    return true;
#else
    static const bool enabled = [] {
        const char* env = std::getenv("CIRCFIT_TRACE");
        return !(env == nullptr || env[0] == '\0' || env[0] == '0');
    }();
    return enabled;
#endif
}

void Trace(const char* tag, const char* fmt, ...) {
    if (!IsTraceEnabled()) {
        return;
    }
    std::fprintf(stderr, "[%s] ", tag);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace Circ::Fit::Platform
