/**
 * @file Curvature.cpp
 * @brief Implementation of the curvature fit
 */

#include <CircFit/Fitting/Curvature.h>
#include <CircFit/Core/Constants.h>
#include <CircFit/Core/Validate.h>
#include <CircFit/Internal/CircleFit.h>
#include <CircFit/Internal/Collinearity.h>
#include <CircFit/Platform/Trace.h>

#include <cmath>

namespace Circ::Fit {

namespace {

constexpr const char* kFuncName = "CurvatureFit";

CurvatureFitResult DegenerateResult(int numPoints) {
    CurvatureFitResult result;
    result.degenerate = true;
    result.numPoints = numPoints;
    return result;
}

} // anonymous namespace

CurvatureFitResult CurvatureFit(const std::vector<double>& x, const std::vector<double>& y,
                                const CurvatureFitParams& params) {
    Validate::RequirePointSet(x, y, MIN_FIT_POINTS, kFuncName);
    Validate::RequireMin(params.guardPrefixCount, 1, "guardPrefixCount", kFuncName);

    int n = static_cast<int>(x.size());

    Internal::MatX points = Internal::PointMatrix(x, y);
    if (Internal::IsDegenerateForFit(points, params.guardPrefixCount,
                                     Internal::RANK_TOLERANCE_AUTO, kFuncName)) {
        return DegenerateResult(n);
    }

    Internal::AlgebraicCircle solved = Internal::SolveKasaMoments(x, y);
    if (!solved.valid) {
        Platform::Trace(kFuncName, "points=%d singular system, reporting degenerate", n);
        return DegenerateResult(n);
    }

    CurvatureFitResult result;
    result.curvature = std::abs(1.0 / std::sqrt(solved.radiusSq));
    result.center = solved.center;
    result.numPoints = n;
    if (params.computeRmse) {
        result.rmse = Internal::CurvatureRmse(x, y, solved.center, result.curvature);
    }
    return result;
}

CurvatureFitResult CurvatureFit(const std::vector<Point2d>& points, const CurvatureFitParams& params) {
    Validate::RequireFinitePoints(points, kFuncName);

    std::vector<double> x, y;
    x.reserve(points.size());
    y.reserve(points.size());
    for (const auto& p : points) {
        x.push_back(p.x);
        y.push_back(p.y);
    }
    return CurvatureFit(x, y, params);
}

} // namespace Circ::Fit
