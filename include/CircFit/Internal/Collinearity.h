#pragma once

/**
 * @file Collinearity.h
 * @brief Closed-loop rank test for degenerate point sets
 *
 * A point set p_0 .. p_{M-1} is closed onto its first point and the M
 * consecutive differences (p_1 - p_0, ..., p_0 - p_{M-1}) are stacked into
 * an M x N matrix. The points are collinear iff that matrix has numerical
 * rank exactly 1. Coincident points give rank 0 and are not collinear.
 *
 * Used by:
 * - Geometry/Collinearity.h (public IsCollinear)
 * - Fitting/Curvature.h, Fitting/CircleFit.h (prefix-50 guard)
 * - Fitting/CircleRmse.h (full-loop guard for short inputs)
 */

#include <CircFit/Internal/Matrix.h>
#include <CircFit/Internal/Solver.h>

#include <vector>

namespace Circ::Fit::Internal {

/// First-stage size of the guard run before a circle or curvature fit
constexpr int FIT_GUARD_PREFIX_COUNT = 50;

/**
 * @brief Stack X/Y coordinates into an L x 2 point matrix
 * @throws InvalidArgumentException if lengths differ
 */
MatX PointMatrix(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Closed-loop differences of the first count rows of points
 *
 * Row i is points(i+1) - points(i) for i < count-1, the last row is
 * points(0) - points(count-1).
 *
 * @param points M x N matrix, rows are points
 * @param count Number of leading points to use (clamped to M)
 * @return count x N matrix (empty for count <= 0)
 */
MatX ClosedLoopDifferences(const MatX& points, int count);

/**
 * @brief Rank test on the closed loop of the first count points
 *
 * @param tolerance Rank tolerance; RANK_TOLERANCE_AUTO for the scale-aware default
 * @return true if the rank of ClosedLoopDifferences(points, count) is exactly 1
 */
bool IsClosedLoopCollinear(const MatX& points, int count,
                           double tolerance = RANK_TOLERANCE_AUTO);

/**
 * @brief Two-stage collinearity test
 *
 * The first min(prefixCount, M) points are tested first. A non-collinear
 * prefix is final. A collinear prefix is rechecked on the full closed loop
 * only when points remain beyond the prefix, and that answer is returned.
 * Fewer than 3 points or fewer than 2 columns are trivially collinear.
 *
 * @param tag Trace tag of the calling operation
 */
bool IsCollinearStaged(const MatX& points, int prefixCount,
                       double tolerance = RANK_TOLERANCE_AUTO,
                       const char* tag = "Collinearity");

/**
 * @brief Degeneracy guard run before solving a circle fit
 *
 * The first min(guardPrefix, M) points are tested. A collinear prefix makes
 * the set degenerate when it covers every point, or when the full closed
 * loop is collinear as well.
 */
bool IsDegenerateForFit(const MatX& points, int guardPrefix,
                        double tolerance = RANK_TOLERANCE_AUTO,
                        const char* tag = "FitGuard");

} // namespace Circ::Fit::Internal
