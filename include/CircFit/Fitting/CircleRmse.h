#pragma once

/**
 * @file CircleRmse.h
 * @brief Root-mean-square radial error of points against a given circle
 */

#include <CircFit/Core/Export.h>
#include <CircFit/Core/Types.h>

#include <vector>

namespace Circ::Fit {

/**
 * @brief Circle RMSE parameters
 */
struct CIRCFIT_API CircleRmseParams {
    /// Point sets shorter than this are rejected when collinear
    int collinearityGuardMaxPoints = 20;

    static CircleRmseParams Default() { return CircleRmseParams(); }

    CircleRmseParams& SetCollinearityGuardMaxPoints(int n) {
        collinearityGuardMaxPoints = n;
        return *this;
    }
};

/**
 * @brief sqrt(mean((|p - (xc, yc)| - r)^2))
 *
 * @throws NonFiniteInputException if a coordinate, r, xc or yc is NaN or Inf
 * @throws ShapeMismatchException if X and Y differ in length
 * @throws InsufficientDataException if fewer than 3 points
 * @throws InvalidArgumentException if r < 0
 * @throws CollinearityException if fewer than
 *         params.collinearityGuardMaxPoints points all lie on one line
 */
CIRCFIT_API double CircleRmse(const std::vector<double>& x, const std::vector<double>& y,
                              double r, double xc, double yc,
                              const CircleRmseParams& params = CircleRmseParams());

/// Circle centered at the origin
CIRCFIT_API double CircleRmse(const std::vector<double>& x, const std::vector<double>& y, double r,
                              const CircleRmseParams& params = CircleRmseParams());

/// @overload
CIRCFIT_API double CircleRmse(const std::vector<double>& x, const std::vector<double>& y,
                              const Circle2d& circle,
                              const CircleRmseParams& params = CircleRmseParams());

/**
 * @brief Center given as an optional argument list
 *
 * An empty center means the origin, two values are (xc, yc).
 *
 * @throws InvalidArityException if center holds one value, or more than two
 */
CIRCFIT_API double CircleRmse(const std::vector<double>& x, const std::vector<double>& y, double r,
                              const std::vector<double>& center,
                              const CircleRmseParams& params = CircleRmseParams());

} // namespace Circ::Fit
