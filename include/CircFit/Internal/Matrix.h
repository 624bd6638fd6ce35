#pragma once

/**
 * @file Matrix.h
 * @brief Dynamic-size dense matrices for CircFit
 *
 * This module provides:
 * - Dynamic-size vectors: VecX
 * - Dynamic-size matrices: MatX
 * - Matrix decomposition result structures (for Solver.h)
 *
 * Used by:
 * - Solver.h (LU, SVD, numerical rank)
 * - Collinearity.h (closed-loop difference matrices)
 * - CircleFit.h (3x3 moment-sum normal equations)
 *
 * Design principles:
 * - Aligned heap memory, owned by the object (RAII, movable)
 * - Row-major storage
 * - Double precision only
 */

#include <CircFit/Core/Exception.h>
#include <CircFit/Platform/Memory.h>

#include <algorithm>
#include <initializer_list>
#include <utility>
#include <vector>

namespace Circ::Fit::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Tolerance for matrix element comparison
constexpr double MATRIX_EPSILON = 1e-12;

// =============================================================================
// Dynamic-Size Vector: VecX
// =============================================================================

/**
 * @brief Dynamic-size vector
 */
class VecX {
public:
    VecX() = default;

    explicit VecX(int size) : size_(std::max(size, 0)) {
        data_ = Allocate(size_);
        std::fill(data_, data_ + size_, 0.0);
    }

    VecX(int size, double value) : VecX(size) {
        std::fill(data_, data_ + size_, value);
    }

    VecX(std::initializer_list<double> init) : VecX(static_cast<int>(init.size())) {
        std::copy(init.begin(), init.end(), data_);
    }

    VecX(const VecX& other) : size_(other.size_) {
        data_ = Allocate(size_);
        std::copy(other.data_, other.data_ + size_, data_);
    }

    VecX(VecX&& other) noexcept : size_(other.size_), data_(other.data_) {
        other.size_ = 0;
        other.data_ = nullptr;
    }

    VecX& operator=(const VecX& other) {
        if (this != &other) {
            VecX tmp(other);
            Swap(tmp);
        }
        return *this;
    }

    VecX& operator=(VecX&& other) noexcept {
        if (this != &other) {
            Platform::AlignedFree(data_);
            size_ = other.size_;
            data_ = other.data_;
            other.size_ = 0;
            other.data_ = nullptr;
        }
        return *this;
    }

    ~VecX() { Platform::AlignedFree(data_); }

    // Element access
    double& operator[](int i) { return data_[i]; }
    const double& operator[](int i) const { return data_[i]; }

    int Size() const { return size_; }
    double* Data() { return data_; }
    const double* Data() const { return data_; }

    static VecX Zero(int size) { return VecX(size, 0.0); }

private:
    static double* Allocate(int n) {
        return static_cast<double*>(Platform::AlignedAlloc(static_cast<size_t>(n) * sizeof(double)));
    }

    void Swap(VecX& other) noexcept {
        std::swap(size_, other.size_);
        std::swap(data_, other.data_);
    }

    int size_ = 0;
    double* data_ = nullptr;
};

// =============================================================================
// Dynamic-Size Matrix: MatX
// =============================================================================

/**
 * @brief Dynamic-size matrix
 *
 * Row-major storage, uses aligned heap memory.
 */
class MatX {
public:
    MatX() = default;

    MatX(int rows, int cols) : rows_(rows), cols_(cols) {
        if (rows_ <= 0 || cols_ <= 0) {
            rows_ = cols_ = 0;
            return;
        }
        data_ = Allocate(Count());
        std::fill(data_, data_ + Count(), 0.0);
    }

    /// Construct from row-major initializer rows, e.g. {{1, 2}, {3, 4}}
    MatX(std::initializer_list<std::initializer_list<double>> rows)
        : MatX(static_cast<int>(rows.size()),
               rows.size() > 0 ? static_cast<int>(rows.begin()->size()) : 0) {
        int i = 0;
        for (const auto& row : rows) {
            if (static_cast<int>(row.size()) != cols_) {
                throw InvalidArgumentException("MatX: ragged initializer rows");
            }
            std::copy(row.begin(), row.end(), data_ + i * cols_);
            ++i;
        }
    }

    MatX(const MatX& other) : rows_(other.rows_), cols_(other.cols_) {
        data_ = Allocate(Count());
        std::copy(other.data_, other.data_ + Count(), data_);
    }

    MatX(MatX&& other) noexcept : rows_(other.rows_), cols_(other.cols_), data_(other.data_) {
        other.rows_ = other.cols_ = 0;
        other.data_ = nullptr;
    }

    MatX& operator=(const MatX& other) {
        if (this != &other) {
            MatX tmp(other);
            Swap(tmp);
        }
        return *this;
    }

    MatX& operator=(MatX&& other) noexcept {
        if (this != &other) {
            Platform::AlignedFree(data_);
            rows_ = other.rows_;
            cols_ = other.cols_;
            data_ = other.data_;
            other.rows_ = other.cols_ = 0;
            other.data_ = nullptr;
        }
        return *this;
    }

    ~MatX() { Platform::AlignedFree(data_); }

    // =========================================================================
    // Element Access
    // =========================================================================

    double& operator()(int row, int col) { return data_[row * cols_ + col]; }
    const double& operator()(int row, int col) const { return data_[row * cols_ + col]; }

    int Rows() const { return rows_; }
    int Cols() const { return cols_; }
    bool Empty() const { return rows_ == 0; }

    double* Data() { return data_; }
    const double* Data() const { return data_; }

    void SwapRows(int a, int b) {
        if (a == b) return;
        std::swap_ranges(data_ + a * cols_, data_ + (a + 1) * cols_, data_ + b * cols_);
    }

    // =========================================================================
    // Arithmetic
    // =========================================================================

    MatX operator*(const MatX& m) const {
        if (cols_ != m.rows_) {
            throw InvalidArgumentException("MatX: dimension mismatch for multiplication");
        }
        MatX result(rows_, m.cols_);
        for (int i = 0; i < rows_; ++i) {
            for (int k = 0; k < cols_; ++k) {
                double a = data_[i * cols_ + k];
                for (int j = 0; j < m.cols_; ++j) {
                    result.data_[i * m.cols_ + j] += a * m.data_[k * m.cols_ + j];
                }
            }
        }
        return result;
    }

    MatX Transpose() const {
        MatX result(cols_, rows_);
        for (int i = 0; i < rows_; ++i) {
            for (int j = 0; j < cols_; ++j) {
                result.data_[j * rows_ + i] = data_[i * cols_ + j];
            }
        }
        return result;
    }

    // =========================================================================
    // Factory Methods
    // =========================================================================

    static MatX Zero(int rows, int cols) { return MatX(rows, cols); }

    static MatX Identity(int size) {
        MatX result(size, size);
        for (int i = 0; i < size; ++i) result.data_[i * size + i] = 1.0;
        return result;
    }

private:
    int Count() const { return rows_ * cols_; }

    static double* Allocate(int n) {
        return static_cast<double*>(Platform::AlignedAlloc(static_cast<size_t>(n) * sizeof(double)));
    }

    void Swap(MatX& other) noexcept {
        std::swap(rows_, other.rows_);
        std::swap(cols_, other.cols_);
        std::swap(data_, other.data_);
    }

    int rows_ = 0;
    int cols_ = 0;
    double* data_ = nullptr;
};

// =============================================================================
// Decomposition Result Structures
// =============================================================================

/**
 * @brief LU decomposition result
 * PA = LU, where P is permutation matrix
 */
struct LUResult {
    MatX L;                    ///< Lower triangular (diagonal = 1)
    MatX U;                    ///< Upper triangular
    std::vector<int> P;        ///< Permutation vector (row swaps)
    int sign = 0;              ///< Sign of permutation (+1 or -1)
    bool valid = false;        ///< Whether decomposition succeeded

    /// Compute determinant from U
    double Determinant() const {
        if (!valid) return 0.0;
        double det = static_cast<double>(sign);
        int n = U.Rows();
        for (int i = 0; i < n; ++i) det *= U(i, i);
        return det;
    }
};

/**
 * @brief SVD decomposition result
 * A = U * S * V^T
 */
struct SVDResult {
    MatX U;                    ///< Left singular vectors (m x k)
    VecX S;                    ///< Singular values (descending order)
    MatX V;                    ///< Right singular vectors (n x k)
    bool valid = false;        ///< Whether decomposition succeeded

    /// Largest singular value, 0 for an empty decomposition
    double MaxSingularValue() const {
        return S.Size() > 0 ? S[0] : 0.0;
    }
};

} // namespace Circ::Fit::Internal
