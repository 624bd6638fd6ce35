#pragma once

/**
 * @file CircFit.h
 * @brief Main header file for the CircFit library
 *
 * CircFit fits circles and curvature to planar point sets and detects the
 * degenerate (collinear) configurations in which such fits are meaningless.
 */

// Configuration and export macros
#include <CircFit/CircFitConfig.h>
#include <CircFit/Core/Export.h>

// Core types and utilities
#include <CircFit/Core/Types.h>
#include <CircFit/Core/Constants.h>
#include <CircFit/Core/Exception.h>

// Feature modules
#include <CircFit/Geometry/Collinearity.h>
#include <CircFit/Fitting/CircleFit.h>
#include <CircFit/Fitting/Curvature.h>
#include <CircFit/Fitting/CircleRmse.h>
#include <CircFit/Fitting/MeanCircleFit.h>

namespace Circ::Fit {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return CIRCFIT_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = CIRCFIT_VERSION_MAJOR;
    minor = CIRCFIT_VERSION_MINOR;
    patch = CIRCFIT_VERSION_PATCH;
}

} // namespace Circ::Fit
