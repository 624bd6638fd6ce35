/**
 * @file Collinearity.cpp
 * @brief Argument normalization for IsCollinear
 *
 * Every call shape is reduced to one M x N point matrix and handed to the
 * staged closed-loop rank test in Internal/Collinearity.
 */

#include <CircFit/Geometry/Collinearity.h>
#include <CircFit/Core/Exception.h>
#include <CircFit/Core/Validate.h>
#include <CircFit/Internal/Collinearity.h>

#include <string>

namespace Circ::Fit {

namespace {

constexpr const char* kFuncName = "IsCollinear";

void RequireFiniteArray(const CoordArray& a, const char* paramName) {
    if (!a.AllFinite()) {
        throw NonFiniteInputException(std::string(kFuncName) + ": " + paramName +
                                      " must be finite and real");
    }
}

/// Element count shared by coordinate arrays that agree in vector/array-ness and size
int CommonPointCount(const std::vector<const CoordArray*>& coords) {
    const char* names = coords.size() == 2 ? "X and Y" : "X, Y, and Z";
    bool firstIsVector = coords[0]->IsVector();
    for (size_t k = 1; k < coords.size(); ++k) {
        if (coords[k]->IsVector() != firstIsVector) {
            throw ShapeMismatchException(std::string(kFuncName) + ": " + names +
                                         " must all be vectors or all be arrays of equal dimensions");
        }
    }
    for (size_t k = 1; k < coords.size(); ++k) {
        if (firstIsVector && coords[k]->Numel() != coords[0]->Numel()) {
            throw ShapeMismatchException(std::string(kFuncName) + ": the vectors " + names +
                                         " must have the same length");
        }
        if (!firstIsVector && !coords[k]->SameShape(*coords[0])) {
            throw ShapeMismatchException(std::string(kFuncName) + ": the arrays " + names +
                                         " must have the same dimensions");
        }
    }
    return coords[0]->Numel();
}

/// Point matrix whose column j is coords[j] in column-major order
Internal::MatX StackColumns(const std::vector<const CoordArray*>& coords, int m) {
    int n = static_cast<int>(coords.size());
    Internal::MatX points(m, n);
    for (int j = 0; j < n; ++j) {
        for (int i = 0; i < m; ++i) {
            points(i, j) = (*coords[j])[i];
        }
    }
    return points;
}

bool TestPoints(const Internal::MatX& points, const CollinearityParams& params) {
    return Internal::IsCollinearStaged(points, params.prefixCount, params.rankTolerance, kFuncName);
}

} // anonymous namespace

bool IsCollinear(const CoordArray& x, const CoordArray& y, const CollinearityParams& params) {
    RequireFiniteArray(x, "X");
    RequireFiniteArray(y, "Y");

    int m = CommonPointCount({&x, &y});
    if (m <= 2) {
        return true;
    }
    return TestPoints(StackColumns({&x, &y}, m), params);
}

bool IsCollinear(const CoordArray& x, const CoordArray& y, const CoordArray& z,
                 const CollinearityParams& params) {
    RequireFiniteArray(x, "X");
    RequireFiniteArray(y, "Y");
    if (z.Empty() || z.IsScalar()) {
        throw InvalidArgumentException(std::string(kFuncName) +
                                       ": Z must be a non-empty vector or array containing at least two values");
    }
    RequireFiniteArray(z, "Z");

    int m = CommonPointCount({&x, &y, &z});
    if (m <= 2) {
        return true;
    }
    return TestPoints(StackColumns({&x, &y, &z}, m), params);
}

bool IsCollinear(const CoordArray& v, const CollinearityParams& params) {
    RequireFiniteArray(v, "V");

    // Real vector = complex values with zero imaginary part, all on one axis
    if (v.IsVector()) {
        return true;
    }
    if (v.Cols() != v.Dim(1)) {
        throw ShapeMismatchException(std::string(kFuncName) + ": V must be a 2-D matrix, got " +
                                     Validate::Detail::FormatValue(v.NumDims()) + " dimensions");
    }

    int m = v.Rows();
    int n = v.Cols();
    if (m <= 2 || n <= 1) {
        return true;
    }

    Internal::MatX points(m, n);
    for (int i = 0; i < m; ++i) {
        for (int j = 0; j < n; ++j) {
            points(i, j) = v.At(i, j);
        }
    }
    return TestPoints(points, params);
}

bool IsCollinear(const std::vector<Point2d>& points, const CollinearityParams& params) {
    Validate::RequireFinitePoints(points, kFuncName);

    int m = static_cast<int>(points.size());
    if (m <= 2) {
        return true;
    }
    Internal::MatX matrix(m, 2);
    for (int i = 0; i < m; ++i) {
        matrix(i, 0) = points[i].x;
        matrix(i, 1) = points[i].y;
    }
    return TestPoints(matrix, params);
}

bool IsCollinearArgs(const std::vector<CoordArray>& args, const CollinearityParams& params) {
    switch (args.size()) {
        case 0:
            throw InvalidArityException(std::string(kFuncName) + ": too few input arguments");
        case 1:
            return IsCollinear(args[0], params);
        case 2:
            return IsCollinear(args[0], args[1], params);
        case 3:
            return IsCollinear(args[0], args[1], args[2], params);
        default:
            throw InvalidArityException(std::string(kFuncName) + ": too many input arguments, got " +
                                        Validate::Detail::FormatValue(args.size()));
    }
}

} // namespace Circ::Fit
