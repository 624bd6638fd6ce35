/**
 * @file CircleRmse.cpp
 * @brief Implementation of the circle RMSE score
 */

#include <CircFit/Fitting/CircleRmse.h>
#include <CircFit/Core/Constants.h>
#include <CircFit/Core/Exception.h>
#include <CircFit/Core/Validate.h>
#include <CircFit/Internal/CircleFit.h>
#include <CircFit/Internal/Collinearity.h>

#include <string>

namespace Circ::Fit {

namespace {

constexpr const char* kFuncName = "CircleRmse";

void RequirePointsAndRadius(const std::vector<double>& x, const std::vector<double>& y, double r) {
    Validate::RequirePointSet(x, y, MIN_FIT_POINTS, kFuncName);
    Validate::RequireFinite(r, "R", kFuncName);
    Validate::RequireNonNegative(r, "R", kFuncName);
}

double Score(const std::vector<double>& x, const std::vector<double>& y,
             double r, double xc, double yc, const CircleRmseParams& params) {
    // Short sets are checked on the full closed loop; longer ones are trusted
    if (static_cast<int>(x.size()) < params.collinearityGuardMaxPoints) {
        Internal::MatX points = Internal::PointMatrix(x, y);
        if (Internal::IsClosedLoopCollinear(points, points.Rows())) {
            throw CollinearityException(std::string(kFuncName) +
                                        ": the points must not all be collinear, or nearly collinear");
        }
    }
    return Internal::RadialRmse(x, y, Point2d(xc, yc), r);
}

} // anonymous namespace

double CircleRmse(const std::vector<double>& x, const std::vector<double>& y,
                  double r, double xc, double yc, const CircleRmseParams& params) {
    RequirePointsAndRadius(x, y, r);
    Validate::RequireFinite(xc, "XC", kFuncName);
    Validate::RequireFinite(yc, "YC", kFuncName);
    return Score(x, y, r, xc, yc, params);
}

double CircleRmse(const std::vector<double>& x, const std::vector<double>& y, double r,
                  const CircleRmseParams& params) {
    RequirePointsAndRadius(x, y, r);
    return Score(x, y, r, 0.0, 0.0, params);
}

double CircleRmse(const std::vector<double>& x, const std::vector<double>& y,
                  const Circle2d& circle, const CircleRmseParams& params) {
    return CircleRmse(x, y, circle.radius, circle.center.x, circle.center.y, params);
}

double CircleRmse(const std::vector<double>& x, const std::vector<double>& y, double r,
                  const std::vector<double>& center, const CircleRmseParams& params) {
    RequirePointsAndRadius(x, y, r);
    switch (center.size()) {
        case 0:
            return Score(x, y, r, 0.0, 0.0, params);
        case 1:
            throw InvalidArityException(std::string(kFuncName) +
                                        ": either both XC and YC must be specified or neither");
        case 2:
            return CircleRmse(x, y, r, center[0], center[1], params);
        default:
            throw InvalidArityException(std::string(kFuncName) +
                                        ": too many input arguments, center has " +
                                        Validate::Detail::FormatValue(center.size()) + " values");
    }
}

} // namespace Circ::Fit
