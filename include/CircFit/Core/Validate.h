#pragma once

/**
 * @file Validate.h
 * @brief Unified argument validation for CircFit
 *
 * Design principles:
 * - Every public operation validates eagerly, before any numeric work
 * - Failure category is carried by the exception type (see Exception.h)
 * - Consistent error message format: "<funcName>: <paramName> must ..., got ..."
 *
 * Layered API:
 * - Point sets: RequireFiniteVector(), RequireSameLength(), RequireMinPoints()
 * - Combined: RequirePointSet() for the usual X/Y pair with a point minimum
 * - Scalars: RequireFinite(), RequireNonNegative(), RequireIntegerMin()
 */

#include <CircFit/Core/Exception.h>
#include <CircFit/Core/Types.h>

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace Circ::Fit::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Point Set Validation
// =============================================================================

/**
 * @brief Check that every coordinate is finite
 *
 * @param values Coordinate vector
 * @param paramName Parameter name for error messages (e.g. "X")
 * @param funcName Function name for error messages
 * @throws NonFiniteInputException on the first NaN or Inf
 */
inline void RequireFiniteVector(const std::vector<double>& values,
                                const char* paramName, const char* funcName) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw NonFiniteInputException(
                std::string(funcName) + ": " + paramName +
                " must be a finite real vector, element " + Detail::FormatValue(i) +
                " is " + Detail::FormatValue(values[i]));
        }
    }
}

/**
 * @brief Check that every point is finite
 */
inline void RequireFinitePoints(const std::vector<Point2d>& points, const char* funcName) {
    for (size_t i = 0; i < points.size(); ++i) {
        if (!points[i].IsValid()) {
            throw NonFiniteInputException(
                std::string(funcName) + ": point " + Detail::FormatValue(i) +
                " is not finite");
        }
    }
}

/**
 * @brief Check that X and Y have the same length
 * @throws ShapeMismatchException on length mismatch
 */
inline void RequireSameLength(const std::vector<double>& x, const std::vector<double>& y,
                              const char* funcName) {
    if (x.size() != y.size()) {
        throw ShapeMismatchException(
            std::string(funcName) + ": X and Y must have the same length, got " +
            Detail::FormatValue(x.size()) + " and " + Detail::FormatValue(y.size()));
    }
}

/**
 * @brief Check that a point set has at least minPoints points
 * @throws InsufficientDataException if count < minPoints
 */
inline void RequireMinPoints(size_t count, int minPoints, const char* funcName) {
    if (count < static_cast<size_t>(minPoints)) {
        throw InsufficientDataException(
            std::string(funcName) + ": need at least " + Detail::FormatValue(minPoints) +
            " points, got " + Detail::FormatValue(count));
    }
}

/**
 * @brief Validate an X/Y point set: finite values, equal length, point minimum
 *
 * Checks run in the order finiteness, length, count, so a short set with a
 * NaN reports the NaN.
 */
inline void RequirePointSet(const std::vector<double>& x, const std::vector<double>& y,
                            int minPoints, const char* funcName) {
    RequireFiniteVector(x, "X", funcName);
    RequireFiniteVector(y, "Y", funcName);
    RequireSameLength(x, y, funcName);
    RequireMinPoints(x.size(), minPoints, funcName);
}

// =============================================================================
// Scalar Validation
// =============================================================================

/**
 * @brief Validate scalar is finite
 * @throws NonFiniteInputException if NaN or Inf
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw NonFiniteInputException(
            std::string(funcName) + ": " + paramName + " must be a finite real scalar, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is at least minimum (>= min)
 */
template<typename T>
inline void RequireMin(T value, T minVal, const char* paramName, const char* funcName) {
    if (value < minVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= " +
            Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate a finite, integral scalar >= minVal
 *
 * @throws NonFiniteInputException if value is NaN or Inf
 * @throws InvalidArgumentException if value is fractional or below minVal
 */
inline void RequireIntegerMin(double value, int minVal,
                              const char* paramName, const char* funcName) {
    RequireFinite(value, paramName, funcName);
    if (value < minVal || value != std::floor(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName +
            " must be an integer greater than or equal to " + Detail::FormatValue(minVal) +
            ", got " + Detail::FormatValue(value));
    }
}

} // namespace Circ::Fit::Validate
