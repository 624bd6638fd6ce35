/**
 * @file CircleFit.cpp
 * @brief Implementation of the Kasa moment-sum circle fit
 */

#include <CircFit/Internal/CircleFit.h>
#include <CircFit/Internal/Solver.h>

#include <cmath>

namespace Circ::Fit::Internal {

AlgebraicCircle SolveKasaMoments(const std::vector<double>& x, const std::vector<double>& y) {
    AlgebraicCircle result;
    size_t n = x.size();

    double sx = 0.0, sy = 0.0;
    double sxx = 0.0, syy = 0.0, sxy = 0.0;
    double sqx = 0.0, sqy = 0.0;   // sum (x^2 + y^2) * x, sum (x^2 + y^2) * y

    for (size_t i = 0; i < n; ++i) {
        double xi = x[i];
        double yi = y[i];
        double sq = xi * xi + yi * yi;
        sx += xi;
        sy += yi;
        sxx += xi * xi;
        syy += yi * yi;
        sxy += xi * yi;
        sqx += sq * xi;
        sqy += sq * yi;
    }

    // [ sx  sy  L  ] [a]   [ sxx + syy ]
    // [ sxy syy sy ] [b] = [ sqy       ]
    // [ sxx sxy sx ] [c]   [ sqx       ]
    MatX A{{sx,  sy,  static_cast<double>(n)},
           {sxy, syy, sy},
           {sxx, sxy, sx}};
    VecX rhs{sxx + syy, sqy, sqx};

    // Pivots of exact moment sums can be legitimately small for tiny
    // coordinates, so only exact zero pivots count as singular here.
    LUResult lu = LU_Decompose(A, 0.0);
    if (!lu.valid) {
        return result;
    }
    VecX sol = SolveFromLU(lu, rhs);

    result.center = Point2d(sol[0] / 2.0, sol[1] / 2.0);
    result.c = sol[2];
    result.radiusSq = result.center.x * result.center.x +
                      result.center.y * result.center.y + result.c;
    result.valid = std::isfinite(result.radiusSq) && result.radiusSq > 0.0 &&
                   result.center.IsValid();
    return result;
}

double RadialRmse(const std::vector<double>& x, const std::vector<double>& y,
                  const Point2d& center, double radius) {
    if (x.empty()) return 0.0;
    double sumSq = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - center.x;
        double dy = y[i] - center.y;
        double r = std::sqrt(dx * dx + dy * dy) - radius;
        sumSq += r * r;
    }
    return std::sqrt(sumSq / static_cast<double>(x.size()));
}

double CurvatureRmse(const std::vector<double>& x, const std::vector<double>& y,
                     const Point2d& center, double curvature) {
    if (x.empty()) return 0.0;
    double sumSq = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - center.x;
        double dy = y[i] - center.y;
        double r = 1.0 / std::sqrt(dx * dx + dy * dy) - curvature;
        sumSq += r * r;
    }
    return std::sqrt(sumSq / static_cast<double>(x.size()));
}

} // namespace Circ::Fit::Internal
