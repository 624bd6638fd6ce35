#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for CircFit
 */

#include <CircFit/Core/Export.h>

#include <cmath>
#include <complex>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

namespace Circ::Fit {

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point with double precision
 */
struct CIRCFIT_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }
};

// =============================================================================
// Circle2d
// =============================================================================

/**
 * @brief 2D circle defined by center and radius
 */
struct CIRCFIT_API Circle2d {
    Point2d center;
    double radius = 0.0;

    Circle2d() = default;
    Circle2d(const Point2d& c, double r) : center(c), radius(r) {}
    Circle2d(double cx, double cy, double r) : center(cx, cy), radius(r) {}

    /// Unsigned curvature (1 / radius), 0 for a zero radius
    double Curvature() const {
        return radius > 0.0 ? 1.0 / radius : 0.0;
    }

    bool IsValid() const {
        return center.IsValid() && std::isfinite(radius) && radius >= 0.0;
    }
};

// =============================================================================
// CoordArray
// =============================================================================

/**
 * @brief Dense real coordinate array with explicit shape
 *
 * Holds one coordinate (X, Y or Z) of a point set, or a whole M x N point
 * matrix whose rows are points. Elements are stored in column-major order,
 * so the linear index walks the first dimension fastest; for an M x N matrix
 * element (i, j) lives at i + j * M.
 *
 * Integer and boolean sources are converted to double on construction.
 */
class CIRCFIT_API CoordArray {
public:
    CoordArray() = default;

    /**
     * @brief Construct from column-major values and shape
     * @throws ShapeMismatchException if the product of dims != values.size()
     * @throws InvalidArgumentException if any dimension is negative
     */
    CoordArray(std::vector<double> values, std::vector<int> dims);

    /// Row vector (1 x N) from any arithmetic element type
    template<typename T>
    static CoordArray FromVector(const std::vector<T>& values) {
        static_assert(std::is_arithmetic<T>::value,
                      "CoordArray::FromVector requires numeric or bool elements");
        std::vector<double> data;
        data.reserve(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
            data.push_back(static_cast<double>(values[i]));
        }
        int n = static_cast<int>(data.size());
        return CoordArray(std::move(data), {1, n});
    }

    /// M x N matrix from row-major rows (each row one point)
    static CoordArray FromRows(const std::vector<std::vector<double>>& rows);

    /// M x 2 matrix [real imag] from complex coordinates
    template<typename T>
    static CoordArray FromComplex(const std::vector<std::complex<T>>& values) {
        int m = static_cast<int>(values.size());
        std::vector<double> data(static_cast<size_t>(m) * 2);
        for (int i = 0; i < m; ++i) {
            data[i] = static_cast<double>(values[i].real());
            data[i + m] = static_cast<double>(values[i].imag());
        }
        return CoordArray(std::move(data), {m, 2});
    }

    // =========================================================================
    // Shape
    // =========================================================================

    int NumDims() const { return static_cast<int>(dims_.size()); }
    int Dim(int i) const { return i < NumDims() ? dims_[i] : 1; }
    const std::vector<int>& Dims() const { return dims_; }
    int Numel() const { return static_cast<int>(data_.size()); }
    bool Empty() const { return data_.empty(); }

    /// Non-empty with at most one dimension different from 1 (scalars count)
    bool IsVector() const;

    bool IsScalar() const { return data_.size() == 1; }

    /// Identical extents (trailing singleton dimensions ignored)
    bool SameShape(const CoordArray& other) const;

    /// Rows/cols when viewed as a 2-D matrix
    int Rows() const { return Dim(0); }
    int Cols() const;

    // =========================================================================
    // Element Access
    // =========================================================================

    double operator[](int i) const { return data_[i]; }
    double At(int row, int col) const { return data_[row + col * Rows()]; }

    const std::vector<double>& Values() const { return data_; }

    /// All elements finite
    bool AllFinite() const;

private:
    std::vector<double> data_;
    std::vector<int> dims_{0, 0};
};

} // namespace Circ::Fit
