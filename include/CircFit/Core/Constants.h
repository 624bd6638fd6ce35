#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and precision constants for CircFit
 */

#include <cmath>
#include <cstddef>
#include <limits>

namespace Circ::Fit {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;

// =============================================================================
// Precision Constants
// =============================================================================

/// Machine epsilon for double (spacing of doubles at 1.0)
constexpr double DOUBLE_EPSILON = std::numeric_limits<double>::epsilon();

// =============================================================================
// Algorithm Limits
// =============================================================================

/// Minimum number of points for any circle or curvature fit
constexpr int MIN_FIT_POINTS = 3;

/// Memory alignment for dynamic matrices
constexpr size_t MEMORY_ALIGNMENT = 64;

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Distance from |x| to the next larger double (MATLAB-style eps(x))
 */
inline double SpacingOf(double x) {
    double ax = std::abs(x);
    return std::nextafter(ax, std::numeric_limits<double>::infinity()) - ax;
}

} // namespace Circ::Fit
