#pragma once

/**
 * @file MeanCircleFit.h
 * @brief Average local radius from circle fits over a sliding window
 *
 * For window width w, h = floor(w/2). Every center index i with a full
 * window [i-h, i+h] is fitted independently and the radii are averaged.
 * On curves whose radius varies along the path (spirals, clothoids) this
 * tracks the mean local radius rather than the single best-fit circle.
 */

#include <CircFit/Core/Export.h>
#include <CircFit/Fitting/CircleFit.h>

#include <functional>
#include <vector>

namespace Circ::Fit {

/// Circle fit applied to each window
using CircleFitFunc = std::function<CircleFitResult(const std::vector<double>&,
                                                    const std::vector<double>&)>;

/**
 * @brief Windowed fit result
 */
struct CIRCFIT_API MeanCircleFitResult {
    double meanRadius = 0.0;            ///< Mean of the windowed radii
    std::vector<double> localRadii;     ///< One slot per point, 0 outside [firstIndex, lastIndex]
    int firstIndex = 0;                 ///< First window center (h)
    int lastIndex = -1;                 ///< Last window center (L - 1 - h)
    int numWindows = 0;                 ///< lastIndex - firstIndex + 1
};

/**
 * @brief Windowed fit with a caller-supplied circle fit
 *
 * Windows are fitted in index order. Exceptions thrown by fitFunc
 * propagate unchanged.
 *
 * @param w Window width; a finite integer >= 2
 * @param fitFunc Circle fit for one window; FitCircle() if empty
 *
 * @throws NonFiniteInputException if a coordinate or w is NaN or Inf
 * @throws ShapeMismatchException if X and Y differ in length
 * @throws InsufficientDataException if fewer than 3 points, or fewer than 2h+1
 * @throws InvalidArgumentException if w is not an integer or w < 2
 */
CIRCFIT_API MeanCircleFitResult MeanCircleFitDetailed(const std::vector<double>& x,
                                                      const std::vector<double>& y,
                                                      double w,
                                                      const CircleFitFunc& fitFunc = CircleFitFunc());

/**
 * @brief Mean radius of windowed FitCircle() fits
 * @see MeanCircleFitDetailed
 */
CIRCFIT_API double MeanCircleFit(const std::vector<double>& x, const std::vector<double>& y, double w);

} // namespace Circ::Fit
