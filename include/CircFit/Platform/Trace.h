#pragma once

/**
 * @file Trace.h
 * @brief Opt-in diagnostic tracing
 *
 * Tracing is off unless the environment variable CIRCFIT_TRACE is set to a
 * value other than "" or "0" (read once, then cached), or the library is
 * built with CIRCFIT_DEBUG defined. Lines go to stderr as
 * "[Tag] key=value ...".
 */

#include <CircFit/Core/Export.h>

namespace Circ::Fit::Platform {

/// Whether trace output is enabled for this process
CIRCFIT_API bool IsTraceEnabled();

/**
 * @brief Print one trace line if tracing is enabled
 * @param tag Short component tag, printed in brackets
 * @param fmt printf-style format for the rest of the line (no newline)
 */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
CIRCFIT_API void Trace(const char* tag, const char* fmt, ...);

} // namespace Circ::Fit::Platform
