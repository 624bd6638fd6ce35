#pragma once

/**
 * @file CircleFit.h
 * @brief Kasa algebraic circle fit from moment sums
 *
 * Circle model: x^2 + y^2 = a*x + b*y + c, center (a/2, b/2),
 * radius^2 = (a/2)^2 + (b/2)^2 + c. Minimizing the algebraic residual over
 * L points gives three normal equations in the sums of x, y, x^2, y^2, xy and
 * (x^2 + y^2) weighted by x and y, solved with LU and partial pivoting.
 *
 * Used by:
 * - Fitting/Curvature.h (curvature = 1 / radius)
 * - Fitting/CircleFit.h (radius, center, distance RMSE)
 */

#include <CircFit/Core/Types.h>

#include <cmath>
#include <vector>

namespace Circ::Fit::Internal {

/**
 * @brief Solution of the Kasa normal equations
 */
struct AlgebraicCircle {
    Point2d center;          ///< (a/2, b/2)
    double c = 0.0;          ///< Constant term of the model
    double radiusSq = 0.0;   ///< |center|^2 + c
    bool valid = false;      ///< false if LU was singular or radiusSq <= 0

    double Radius() const { return valid ? std::sqrt(radiusSq) : 0.0; }
};

/**
 * @brief Solve the Kasa normal equations for a point set
 *
 * No argument validation: x and y must have equal length >= 3 and be finite.
 * A singular system or a non-positive radius^2 returns valid = false.
 */
AlgebraicCircle SolveKasaMoments(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief sqrt(mean((|p - center| - radius)^2)) (distance space)
 */
double RadialRmse(const std::vector<double>& x, const std::vector<double>& y,
                  const Point2d& center, double radius);

/**
 * @brief sqrt(mean((1/|p - center| - curvature)^2)) (curvature space)
 */
double CurvatureRmse(const std::vector<double>& x, const std::vector<double>& y,
                     const Point2d& center, double curvature);

} // namespace Circ::Fit::Internal
