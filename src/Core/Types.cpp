/**
 * @file Types.cpp
 * @brief Implementation of core geometric and coordinate types
 */

#include <CircFit/Core/Types.h>
#include <CircFit/Core/Exception.h>

#include <algorithm>
#include <string>

namespace Circ::Fit {

// =============================================================================
// CoordArray Implementation
// =============================================================================

CoordArray::CoordArray(std::vector<double> values, std::vector<int> dims)
    : data_(std::move(values)), dims_(std::move(dims)) {
    if (dims_.empty()) {
        dims_ = {static_cast<int>(data_.size()), 1};
    }
    if (dims_.size() == 1) {
        dims_.push_back(1);
    }

    size_t expected = 1;
    for (int d : dims_) {
        if (d < 0) {
            throw InvalidArgumentException("CoordArray: negative dimension " + std::to_string(d));
        }
        expected *= static_cast<size_t>(d);
    }
    if (expected != data_.size()) {
        throw ShapeMismatchException("CoordArray: shape holds " + std::to_string(expected) +
                                     " elements, got " + std::to_string(data_.size()));
    }
}

CoordArray CoordArray::FromRows(const std::vector<std::vector<double>>& rows) {
    int m = static_cast<int>(rows.size());
    int n = m > 0 ? static_cast<int>(rows[0].size()) : 0;

    std::vector<double> data(static_cast<size_t>(m) * n);
    for (int i = 0; i < m; ++i) {
        if (static_cast<int>(rows[i].size()) != n) {
            throw ShapeMismatchException("CoordArray::FromRows: row " + std::to_string(i) +
                                         " has " + std::to_string(rows[i].size()) +
                                         " columns, expected " + std::to_string(n));
        }
        for (int j = 0; j < n; ++j) {
            data[i + static_cast<size_t>(j) * m] = rows[i][j];
        }
    }
    return CoordArray(std::move(data), {m, n});
}

bool CoordArray::IsVector() const {
    if (data_.empty()) {
        return false;
    }
    int nonSingleton = 0;
    for (int d : dims_) {
        if (d != 1) ++nonSingleton;
    }
    return nonSingleton <= 1;
}

bool CoordArray::SameShape(const CoordArray& other) const {
    // Trailing singleton dimensions do not count
    int n = std::max(NumDims(), other.NumDims());
    for (int i = 0; i < n; ++i) {
        if (Dim(i) != other.Dim(i)) {
            return false;
        }
    }
    return true;
}

int CoordArray::Cols() const {
    int cols = 1;
    for (int i = 1; i < NumDims(); ++i) {
        cols *= dims_[i];
    }
    return cols;
}

bool CoordArray::AllFinite() const {
    return std::all_of(data_.begin(), data_.end(),
                       [](double v) { return std::isfinite(v); });
}

} // namespace Circ::Fit
