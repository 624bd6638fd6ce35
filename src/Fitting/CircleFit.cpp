/**
 * @file CircleFit.cpp
 * @brief Implementation of the elementary circle fit
 */

#include <CircFit/Fitting/CircleFit.h>
#include <CircFit/Core/Constants.h>
#include <CircFit/Core/Exception.h>
#include <CircFit/Core/Validate.h>
#include <CircFit/Internal/CircleFit.h>
#include <CircFit/Internal/Collinearity.h>

#include <string>

namespace Circ::Fit {

namespace {
constexpr const char* kFuncName = "FitCircle";
}

CircleFitResult FitCircle(const std::vector<double>& x, const std::vector<double>& y,
                          const CircleFitParams& params) {
    Validate::RequirePointSet(x, y, MIN_FIT_POINTS, kFuncName);
    Validate::RequireMin(params.guardPrefixCount, 1, "guardPrefixCount", kFuncName);

    Internal::MatX points = Internal::PointMatrix(x, y);
    if (Internal::IsDegenerateForFit(points, params.guardPrefixCount,
                                     Internal::RANK_TOLERANCE_AUTO, kFuncName)) {
        throw CollinearityException(std::string(kFuncName) +
                                    ": the points must not all be collinear, or nearly collinear");
    }

    Internal::AlgebraicCircle solved = Internal::SolveKasaMoments(x, y);
    if (!solved.valid) {
        throw CollinearityException(std::string(kFuncName) +
                                    ": normal equations are singular for " +
                                    Validate::Detail::FormatValue(x.size()) + " points");
    }

    CircleFitResult result;
    result.circle = Circle2d(solved.center, solved.Radius());
    result.rmse = Internal::RadialRmse(x, y, solved.center, result.circle.radius);
    result.numPoints = static_cast<int>(x.size());
    return result;
}

CircleFitResult FitCircle(const std::vector<Point2d>& points, const CircleFitParams& params) {
    Validate::RequireFinitePoints(points, kFuncName);

    std::vector<double> x, y;
    x.reserve(points.size());
    y.reserve(points.size());
    for (const auto& p : points) {
        x.push_back(p.x);
        y.push_back(p.y);
    }
    return FitCircle(x, y, params);
}

} // namespace Circ::Fit
