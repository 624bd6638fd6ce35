#pragma once

/**
 * @file Collinearity.h
 * @brief Degeneracy detection for point sets in two or three dimensions
 *
 * IsCollinear() answers whether a point set lies on one straight line, within
 * floating-point resolution. Points are given as separate coordinate arrays
 * (X, Y[, Z]), as one M x N matrix whose rows are points, or as complex
 * numbers (real part X, imaginary part Y).
 *
 * Fewer than three points, or fewer than two coordinate dimensions, are
 * always collinear. A single real vector is read as complex numbers with
 * zero imaginary part, so it is always collinear too.
 *
 * Example:
 * @code
 * std::vector<double> x = {1, 2, 3};
 * std::vector<double> y = {1, 2, 3};
 * bool degenerate = IsCollinear(x, y);   // true
 * @endcode
 */

#include <CircFit/Core/Export.h>
#include <CircFit/Core/Types.h>

#include <complex>
#include <vector>

namespace Circ::Fit {

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Collinearity test parameters
 */
struct CIRCFIT_API CollinearityParams {
    /// Points tested in the first stage; a collinear prefix is rechecked on all points
    int prefixCount = 64;

    /// Rank tolerance; negative = max(rows, cols) * eps(largest singular value)
    double rankTolerance = -1.0;

    static CollinearityParams Default() { return CollinearityParams(); }

    CollinearityParams& SetPrefixCount(int n) { prefixCount = n; return *this; }
    CollinearityParams& SetRankTolerance(double t) { rankTolerance = t; return *this; }
};

// =============================================================================
// Coordinate Array Forms
// =============================================================================

/**
 * @brief Collinearity of 2-D points from X and Y coordinate arrays
 *
 * X and Y must both be vectors of equal length, or both arrays of equal
 * shape (elements are paired in column-major order).
 *
 * @throws NonFiniteInputException if any coordinate is NaN or Inf
 * @throws ShapeMismatchException on vector/array or size disagreement
 */
CIRCFIT_API bool IsCollinear(const CoordArray& x, const CoordArray& y,
                             const CollinearityParams& params = CollinearityParams());

/**
 * @brief Collinearity of 3-D points from X, Y and Z coordinate arrays
 *
 * @throws InvalidArgumentException if Z is empty or a scalar
 * @throws NonFiniteInputException if any coordinate is NaN or Inf
 * @throws ShapeMismatchException on vector/array or size disagreement
 */
CIRCFIT_API bool IsCollinear(const CoordArray& x, const CoordArray& y, const CoordArray& z,
                             const CollinearityParams& params = CollinearityParams());

/**
 * @brief Collinearity of the rows of an M x N matrix
 *
 * A vector argument is read as points on the real axis and returns true once
 * its values are known to be finite.
 *
 * @throws NonFiniteInputException if any value is NaN or Inf
 * @throws ShapeMismatchException if v has more than two non-singleton dimensions
 */
CIRCFIT_API bool IsCollinear(const CoordArray& v,
                             const CollinearityParams& params = CollinearityParams());

/**
 * @brief Collinearity of 2-D points
 */
CIRCFIT_API bool IsCollinear(const std::vector<Point2d>& points,
                             const CollinearityParams& params = CollinearityParams());

/**
 * @brief Argument-list entry point
 *
 * One, two or three arrays dispatch to the forms above.
 *
 * @throws InvalidArityException for zero or more than three arrays
 */
CIRCFIT_API bool IsCollinearArgs(const std::vector<CoordArray>& args,
                                 const CollinearityParams& params = CollinearityParams());

// =============================================================================
// Typed Vector Forms
// =============================================================================

/// X/Y coordinate vectors of any arithmetic type (bool included)
template<typename T>
bool IsCollinear(const std::vector<T>& x, const std::vector<T>& y,
                 const CollinearityParams& params = CollinearityParams()) {
    return IsCollinear(CoordArray::FromVector(x), CoordArray::FromVector(y), params);
}

/// X/Y/Z coordinate vectors of any arithmetic type (bool included)
template<typename T>
bool IsCollinear(const std::vector<T>& x, const std::vector<T>& y, const std::vector<T>& z,
                 const CollinearityParams& params = CollinearityParams()) {
    return IsCollinear(CoordArray::FromVector(x), CoordArray::FromVector(y),
                       CoordArray::FromVector(z), params);
}

/// Single real vector: points on the real axis
template<typename T>
bool IsCollinear(const std::vector<T>& v,
                 const CollinearityParams& params = CollinearityParams()) {
    return IsCollinear(CoordArray::FromVector(v), params);
}

/// Complex coordinates: real part X, imaginary part Y
template<typename T>
bool IsCollinear(const std::vector<std::complex<T>>& z,
                 const CollinearityParams& params = CollinearityParams()) {
    return IsCollinear(CoordArray::FromComplex(z), params);
}

} // namespace Circ::Fit
