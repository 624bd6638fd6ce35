#pragma once

/**
 * @file CircleFit.h
 * @brief Elementary algebraic (Kasa) circle fit
 *
 * FitCircle() returns the least-squares circle of the algebraic residual
 * x^2 + y^2 - a*x - b*y - c and its RMSE in distance space. It is the default
 * primitive of MeanCircleFit().
 */

#include <CircFit/Core/Export.h>
#include <CircFit/Core/Types.h>

#include <vector>

namespace Circ::Fit {

/**
 * @brief Circle fit parameters
 */
struct CIRCFIT_API CircleFitParams {
    /// Points checked for collinearity before the full closed-loop check
    int guardPrefixCount = 50;

    static CircleFitParams Default() { return CircleFitParams(); }

    CircleFitParams& SetGuardPrefixCount(int n) { guardPrefixCount = n; return *this; }
};

/**
 * @brief Circle fit result
 */
struct CIRCFIT_API CircleFitResult {
    Circle2d circle;        ///< Fitted circle
    double rmse = 0.0;      ///< sqrt(mean((|p - center| - radius)^2))
    int numPoints = 0;      ///< Number of input points

    double Radius() const { return circle.radius; }
    const Point2d& Center() const { return circle.center; }
};

/**
 * @brief Fit a circle to X/Y coordinates
 *
 * @note Same raw moment sums as CurvatureFit; center data far from the origin.
 *
 * @throws NonFiniteInputException if any coordinate is NaN or Inf
 * @throws ShapeMismatchException if X and Y differ in length
 * @throws InsufficientDataException if fewer than 3 points
 * @throws InvalidArgumentException if params.guardPrefixCount < 1
 * @throws CollinearityException if the points are collinear or the normal
 *         equations are singular
 */
CIRCFIT_API CircleFitResult FitCircle(const std::vector<double>& x, const std::vector<double>& y,
                                      const CircleFitParams& params = CircleFitParams());

/// @overload
CIRCFIT_API CircleFitResult FitCircle(const std::vector<Point2d>& points,
                                      const CircleFitParams& params = CircleFitParams());

} // namespace Circ::Fit
