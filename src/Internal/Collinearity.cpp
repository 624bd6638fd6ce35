/**
 * @file Collinearity.cpp
 * @brief Implementation of the closed-loop rank test
 */

#include <CircFit/Internal/Collinearity.h>
#include <CircFit/Core/Exception.h>
#include <CircFit/Platform/Trace.h>

#include <algorithm>

namespace Circ::Fit::Internal {

MatX PointMatrix(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw InvalidArgumentException("PointMatrix: X and Y must have the same length");
    }
    int m = static_cast<int>(x.size());
    MatX points(m, 2);
    for (int i = 0; i < m; ++i) {
        points(i, 0) = x[i];
        points(i, 1) = y[i];
    }
    return points;
}

MatX ClosedLoopDifferences(const MatX& points, int count) {
    count = std::min(count, points.Rows());
    int n = points.Cols();
    if (count <= 0 || n <= 0) {
        return MatX();
    }

    MatX diff(count, n);
    for (int i = 0; i < count; ++i) {
        int next = (i + 1 == count) ? 0 : i + 1;
        for (int j = 0; j < n; ++j) {
            diff(i, j) = points(next, j) - points(i, j);
        }
    }
    return diff;
}

bool IsClosedLoopCollinear(const MatX& points, int count, double tolerance) {
    return ComputeRank(ClosedLoopDifferences(points, count), tolerance) == 1;
}

bool IsCollinearStaged(const MatX& points, int prefixCount, double tolerance, const char* tag) {
    int m = points.Rows();
    if (m <= 2 || points.Cols() <= 1) {
        return true;
    }

    int prefix = std::min(std::max(prefixCount, 1), m);
    if (!IsClosedLoopCollinear(points, prefix, tolerance)) {
        Platform::Trace(tag, "points=%d prefix=%d verdict=general", m, prefix);
        return false;
    }
    if (m <= prefix) {
        Platform::Trace(tag, "points=%d prefix=%d verdict=collinear", m, prefix);
        return true;
    }

    bool full = IsClosedLoopCollinear(points, m, tolerance);
    Platform::Trace(tag, "points=%d prefix=%d prefix_verdict=collinear full_verdict=%s",
                    m, prefix, full ? "collinear" : "general");
    return full;
}

bool IsDegenerateForFit(const MatX& points, int guardPrefix, double tolerance, const char* tag) {
    int m = points.Rows();
    int prefix = std::min(std::max(guardPrefix, 1), m);
    if (!IsClosedLoopCollinear(points, prefix, tolerance)) {
        return false;
    }
    if (m <= prefix) {
        Platform::Trace(tag, "points=%d guard=%d verdict=degenerate", m, prefix);
        return true;
    }

    bool full = IsClosedLoopCollinear(points, m, tolerance);
    Platform::Trace(tag, "points=%d guard=%d prefix_verdict=collinear full_verdict=%s",
                    m, prefix, full ? "degenerate" : "general");
    return full;
}

} // namespace Circ::Fit::Internal
