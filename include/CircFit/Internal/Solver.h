#pragma once

/**
 * @file Solver.h
 * @brief Linear equation solvers and numerical rank for CircFit
 *
 * This module provides:
 * - LU decomposition with partial pivoting, and solves from it
 * - Singular Value Decomposition (one-sided Jacobi)
 * - Numerical rank with an absolute or a scale-aware tolerance
 *
 * Used by:
 * - CircleFit.h (3x3 moment-sum normal equations)
 * - Collinearity.h (rank of closed-loop difference matrices)
 *
 * Design principles:
 * - Numerical stability via pivoting, never explicit inversion
 * - Singular systems are reported through result flags, not exceptions
 */

#include <CircFit/Internal/Matrix.h>

#include <vector>

namespace Circ::Fit::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Default tolerance for singularity detection (LU pivots)
constexpr double SOLVER_SINGULAR_THRESHOLD = 1e-12;

/// Maximum Jacobi sweeps for SVD convergence
constexpr int SVD_MAX_SWEEPS = 100;

/// Pass as tolerance to request the scale-aware default (see DefaultRankTolerance)
constexpr double RANK_TOLERANCE_AUTO = -1.0;

// =============================================================================
// LU Decomposition
// =============================================================================

/**
 * @brief In-place LU decomposition
 * A is overwritten with L (lower, unit diagonal) and U (upper)
 *
 * @param A Input/output matrix, overwritten with LU factors
 * @param P Output permutation vector
 * @param threshold Pivot magnitude at or below which A is treated as singular
 * @return sign of permutation (+1 or -1), 0 if singular
 * @throws InvalidArgumentException if A is not square
 */
int LU_DecomposeInPlace(MatX& A, std::vector<int>& P,
                        double threshold = SOLVER_SINGULAR_THRESHOLD);

/**
 * @brief LU decomposition with partial pivoting
 * Computes PA = LU where P is permutation, L lower triangular (diagonal=1), U upper triangular
 *
 * @param A Input square matrix (n x n)
 * @return LUResult containing L, U, P, and validity flag
 *
 * Complexity: O(n^3)
 */
LUResult LU_Decompose(const MatX& A, double threshold = SOLVER_SINGULAR_THRESHOLD);

/**
 * @brief Solve from pre-computed LU decomposition
 * @return Solution x, or zero vector if lu is not valid
 */
VecX SolveFromLU(const LUResult& lu, const VecX& b);

/**
 * @brief Solve Ax = b using LU decomposition
 * @return Solution x, or zero vector if singular
 * @throws InvalidArgumentException if dimensions don't match
 */
VecX SolveLU(const MatX& A, const VecX& b);

/**
 * @brief Solve triangular system Lx = b (lower triangular)
 * @param unitDiagonal If true, assume diagonal elements are 1
 */
VecX SolveLowerTriangular(const MatX& L, const VecX& b, bool unitDiagonal = false);

/**
 * @brief Solve triangular system Ux = b (upper triangular)
 */
VecX SolveUpperTriangular(const MatX& U, const VecX& b);

// =============================================================================
// Singular Value Decomposition
// =============================================================================

/**
 * @brief Singular Value Decomposition (one-sided Jacobi)
 * Computes A = U * S * V^T with S sorted in descending order
 *
 * @param A Input matrix (m x n)
 * @param computeVectors If false only S is filled (U and V stay empty)
 * @return SVDResult; S has min(m, n) entries
 *
 * Complexity: O(sweeps * m * n^2) for m >= n
 */
SVDResult SVD_Decompose(const MatX& A, bool computeVectors = true);

// =============================================================================
// Numerical Rank
// =============================================================================

/**
 * @brief Scale-aware rank tolerance: max(rows, cols) * eps(sigma_max)
 *
 * eps(s) is the spacing of doubles at s. With this tolerance data that is
 * collinear to within a few ulps of its own magnitude counts as rank 1.
 */
double DefaultRankTolerance(const SVDResult& svd, int rows, int cols);

/**
 * @brief Compute numerical rank of matrix
 * Count of singular values above tolerance
 *
 * @param A Input matrix
 * @param tolerance Threshold for zero singular values;
 *                  RANK_TOLERANCE_AUTO (negative) selects DefaultRankTolerance
 * @return Numerical rank (0 for an empty matrix)
 */
int ComputeRank(const MatX& A, double tolerance = RANK_TOLERANCE_AUTO);

} // namespace Circ::Fit::Internal
