/**
 * @file MeanCircleFit.cpp
 * @brief Implementation of the windowed radius aggregator
 */

#include <CircFit/Fitting/MeanCircleFit.h>
#include <CircFit/Core/Constants.h>
#include <CircFit/Core/Exception.h>
#include <CircFit/Core/Validate.h>
#include <CircFit/Platform/Trace.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace Circ::Fit {

namespace {
constexpr const char* kFuncName = "MeanCircleFit";
}

MeanCircleFitResult MeanCircleFitDetailed(const std::vector<double>& x, const std::vector<double>& y,
                                          double w, const CircleFitFunc& fitFunc) {
    Validate::RequirePointSet(x, y, MIN_FIT_POINTS, kFuncName);
    Validate::RequireIntegerMin(w, 2, "W", kFuncName);

    int n = static_cast<int>(x.size());
    double halfWidth = std::floor(0.5 * w);
    if (2.0 * halfWidth + 1.0 > static_cast<double>(n)) {
        throw InsufficientDataException(
            std::string(kFuncName) + ": window width " + Validate::Detail::FormatValue(w) +
            " needs at least " + Validate::Detail::FormatValue(2.0 * halfWidth + 1.0) +
            " points, got " + Validate::Detail::FormatValue(n));
    }
    int h = static_cast<int>(halfWidth);

    CircleFitFunc fit = fitFunc ? fitFunc
                                : CircleFitFunc([](const std::vector<double>& wx,
                                                   const std::vector<double>& wy) {
                                      return FitCircle(wx, wy);
                                  });

    MeanCircleFitResult result;
    result.localRadii.assign(n, 0.0);
    result.firstIndex = h;
    result.lastIndex = n - 1 - h;
    result.numWindows = result.lastIndex - result.firstIndex + 1;

    std::vector<double> wx(2 * h + 1);
    std::vector<double> wy(2 * h + 1);
    double sum = 0.0;
    for (int i = result.firstIndex; i <= result.lastIndex; ++i) {
        std::copy(x.begin() + (i - h), x.begin() + (i + h + 1), wx.begin());
        std::copy(y.begin() + (i - h), y.begin() + (i + h + 1), wy.begin());
        double radius = fit(wx, wy).circle.radius;
        result.localRadii[i] = radius;
        sum += radius;
    }
    result.meanRadius = sum / static_cast<double>(result.numWindows);

    Platform::Trace(kFuncName, "points=%d w=%d windows=%d mean_radius=%.10g",
                    n, static_cast<int>(w), result.numWindows, result.meanRadius);
    return result;
}

double MeanCircleFit(const std::vector<double>& x, const std::vector<double>& y, double w) {
    return MeanCircleFitDetailed(x, y, w).meanRadius;
}

} // namespace Circ::Fit
