#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - CIRCFIT_BUILD_SHARED: when building CircFit as shared library
 *   - CIRCFIT_USE_SHARED: when using CircFit as shared library
 *   - CIRCFIT_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(CIRCFIT_BUILD_SHARED)
        #define CIRCFIT_API __declspec(dllexport)
    #elif defined(CIRCFIT_USE_SHARED)
        #define CIRCFIT_API __declspec(dllimport)
    #else
        #define CIRCFIT_API
    #endif
#else
    #if defined(CIRCFIT_BUILD_SHARED)
        #define CIRCFIT_API __attribute__((visibility("default")))
    #else
        #define CIRCFIT_API
    #endif
#endif
