#pragma once

/**
 * @file Curvature.h
 * @brief Curvature of the best-fit circle through a planar point set
 *
 * CurvatureFit() returns 1/R of the Kasa circle and the RMSE of the points'
 * inverse distances from its center (curvature space). Collinear input is
 * not an error: it reports curvature 0 and no RMSE.
 *
 * Example:
 * @code
 * std::vector<double> x = {1, 0, -1, 0, 1};
 * std::vector<double> y = {0, 1, 0, -1, 0};
 * auto fit = CurvatureFit(x, y);
 * // fit.curvature ~ 1.0, *fit.rmse ~ 0.0
 * @endcode
 */

#include <CircFit/Core/Export.h>
#include <CircFit/Core/Types.h>

#include <optional>
#include <vector>

namespace Circ::Fit {

/**
 * @brief Curvature fit parameters
 */
struct CIRCFIT_API CurvatureFitParams {
    /// Compute the curvature-space RMSE
    bool computeRmse = true;

    /// Points checked for collinearity before the full closed-loop check
    int guardPrefixCount = 50;

    static CurvatureFitParams Default() { return CurvatureFitParams(); }

    CurvatureFitParams& SetComputeRmse(bool v) { computeRmse = v; return *this; }
    CurvatureFitParams& SetGuardPrefixCount(int n) { guardPrefixCount = n; return *this; }
};

/**
 * @brief Curvature fit result
 */
struct CIRCFIT_API CurvatureFitResult {
    double curvature = 0.0;          ///< 1 / radius, 0 when degenerate
    std::optional<double> rmse;      ///< Empty when degenerate or not requested
    bool degenerate = false;         ///< Points collinear (or system singular)
    Point2d center;                  ///< Fitted center, (0, 0) when degenerate
    int numPoints = 0;               ///< Number of input points

    /// Radius 1/curvature, 0 when degenerate
    double Radius() const { return curvature > 0.0 ? 1.0 / curvature : 0.0; }
};

/**
 * @brief Fit curvature to X/Y coordinates
 *
 * @note The normal equations use raw moment sums, so precision degrades with
 *       the distance of the points from the origin relative to their spread.
 *       Subtract the centroid first for data far from the origin.
 *
 * @throws NonFiniteInputException if any coordinate is NaN or Inf
 * @throws ShapeMismatchException if X and Y differ in length
 * @throws InsufficientDataException if fewer than 3 points
 * @throws InvalidArgumentException if params.guardPrefixCount < 1
 */
CIRCFIT_API CurvatureFitResult CurvatureFit(const std::vector<double>& x, const std::vector<double>& y,
                                            const CurvatureFitParams& params = CurvatureFitParams());

/// @overload
CIRCFIT_API CurvatureFitResult CurvatureFit(const std::vector<Point2d>& points,
                                            const CurvatureFitParams& params = CurvatureFitParams());

} // namespace Circ::Fit
