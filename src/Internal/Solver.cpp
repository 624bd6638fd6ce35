/**
 * @file Solver.cpp
 * @brief Implementation of linear equation solvers and numerical rank
 */

#include <CircFit/Internal/Solver.h>
#include <CircFit/Core/Constants.h>
#include <CircFit/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace Circ::Fit::Internal {

// =============================================================================
// Triangular Solvers
// =============================================================================

VecX SolveLowerTriangular(const MatX& L, const VecX& b, bool unitDiagonal) {
    int n = L.Rows();
    if (n != L.Cols() || n != b.Size()) {
        throw InvalidArgumentException("SolveLowerTriangular: dimension mismatch");
    }

    VecX x(n);
    for (int i = 0; i < n; ++i) {
        double sum = b[i];
        for (int j = 0; j < i; ++j) {
            sum -= L(i, j) * x[j];
        }
        if (unitDiagonal) {
            x[i] = sum;
        } else if (std::abs(L(i, i)) < SOLVER_SINGULAR_THRESHOLD) {
            x[i] = 0.0;
        } else {
            x[i] = sum / L(i, i);
        }
    }
    return x;
}

VecX SolveUpperTriangular(const MatX& U, const VecX& b) {
    int n = U.Rows();
    if (n != U.Cols() || n != b.Size()) {
        throw InvalidArgumentException("SolveUpperTriangular: dimension mismatch");
    }

    VecX x(n);
    for (int i = n - 1; i >= 0; --i) {
        double sum = b[i];
        for (int j = i + 1; j < n; ++j) {
            sum -= U(i, j) * x[j];
        }
        x[i] = std::abs(U(i, i)) < SOLVER_SINGULAR_THRESHOLD ? 0.0 : sum / U(i, i);
    }
    return x;
}

// =============================================================================
// LU Decomposition
// =============================================================================

int LU_DecomposeInPlace(MatX& A, std::vector<int>& P, double threshold) {
    int n = A.Rows();
    if (n != A.Cols()) {
        throw InvalidArgumentException("LU_DecomposeInPlace: matrix must be square");
    }

    P.resize(n);
    for (int i = 0; i < n; ++i) P[i] = i;

    int sign = 1;
    for (int k = 0; k < n; ++k) {
        // Partial pivot: largest magnitude in column k at or below the diagonal
        int pivot = k;
        double pivotAbs = std::abs(A(k, k));
        for (int i = k + 1; i < n; ++i) {
            if (std::abs(A(i, k)) > pivotAbs) {
                pivotAbs = std::abs(A(i, k));
                pivot = i;
            }
        }

        if (pivotAbs <= threshold) {
            return 0;
        }

        if (pivot != k) {
            std::swap(P[k], P[pivot]);
            A.SwapRows(k, pivot);
            sign = -sign;
        }

        for (int i = k + 1; i < n; ++i) {
            double factor = A(i, k) / A(k, k);
            A(i, k) = factor;
            for (int j = k + 1; j < n; ++j) {
                A(i, j) -= factor * A(k, j);
            }
        }
    }
    return sign;
}

LUResult LU_Decompose(const MatX& A, double threshold) {
    LUResult result;
    int n = A.Rows();
    if (n != A.Cols()) {
        return result;
    }
    if (n == 0) {
        result.sign = 1;
        result.valid = true;
        return result;
    }

    MatX packed = A;
    result.sign = LU_DecomposeInPlace(packed, result.P, threshold);
    if (result.sign == 0) {
        return result;
    }

    // Unpack: strict lower part is L (unit diagonal), the rest is U
    result.L = MatX::Identity(n);
    result.U = MatX::Zero(n, n);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i > j) {
                result.L(i, j) = packed(i, j);
            } else {
                result.U(i, j) = packed(i, j);
            }
        }
    }
    result.valid = true;
    return result;
}

VecX SolveFromLU(const LUResult& lu, const VecX& b) {
    if (!lu.valid) {
        return VecX::Zero(b.Size());
    }

    int n = lu.L.Rows();
    if (b.Size() != n) {
        throw InvalidArgumentException("SolveFromLU: dimension mismatch");
    }

    VecX pb(n);
    for (int i = 0; i < n; ++i) pb[i] = b[lu.P[i]];

    VecX y = SolveLowerTriangular(lu.L, pb, true);
    return SolveUpperTriangular(lu.U, y);
}

VecX SolveLU(const MatX& A, const VecX& b) {
    if (A.Rows() != b.Size()) {
        throw InvalidArgumentException("SolveLU: dimension mismatch");
    }
    return SolveFromLU(LU_Decompose(A), b);
}

// =============================================================================
// SVD Decomposition
// =============================================================================

namespace {

/// Rotate columns p and q of M from the right by (c, s)
void RotateColumns(MatX& M, int p, int q, double c, double s) {
    for (int i = 0; i < M.Rows(); ++i) {
        double mp = M(i, p);
        double mq = M(i, q);
        M(i, p) = c * mp + s * mq;
        M(i, q) = -s * mp + c * mq;
    }
}

} // anonymous namespace

SVDResult SVD_Decompose(const MatX& A, bool computeVectors) {
    SVDResult result;
    int m = A.Rows();
    int n = A.Cols();

    if (m == 0 || n == 0) {
        result.valid = true;
        return result;
    }

    // Work on the tall orientation; U and V swap roles at the end
    bool transpose = m < n;
    MatX B = transpose ? A.Transpose() : A;
    if (transpose) std::swap(m, n);

    MatX V = computeVectors ? MatX::Identity(n) : MatX();
    const double tol = 1e-14;

    for (int sweep = 0; sweep < SVD_MAX_SWEEPS; ++sweep) {
        double maxOffDiag = 0.0;
        double maxDiag = 0.0;

        for (int i = 0; i < n - 1; ++i) {
            for (int j = i + 1; j < n; ++j) {
                double bii = 0.0, bij = 0.0, bjj = 0.0;
                for (int k = 0; k < m; ++k) {
                    bii += B(k, i) * B(k, i);
                    bij += B(k, i) * B(k, j);
                    bjj += B(k, j) * B(k, j);
                }
                maxDiag = std::max(maxDiag, std::max(bii, bjj));
                maxOffDiag = std::max(maxOffDiag, std::abs(bij));

                // Already orthogonal (relative). sqrt of each factor avoids
                // underflow for tiny-scale data.
                if (bij == 0.0 || std::abs(bij) < tol * std::sqrt(bii) * std::sqrt(bjj)) {
                    continue;
                }

                // tau = cot(2 theta); t = tan(theta), smaller root
                double tau = (bii - bjj) / (2.0 * bij);
                double t = (tau >= 0.0) ? 1.0 / (tau + std::sqrt(1.0 + tau * tau))
                                        : 1.0 / (tau - std::sqrt(1.0 + tau * tau));
                double c = 1.0 / std::sqrt(1.0 + t * t);
                double s = t * c;

                RotateColumns(B, i, j, c, s);
                if (computeVectors) RotateColumns(V, i, j, c, s);
            }
        }

        if (maxOffDiag <= tol * maxDiag) {
            break;
        }
    }

    // Singular values are the column norms of the rotated matrix
    result.S = VecX(n);
    for (int j = 0; j < n; ++j) {
        double norm = 0.0;
        for (int i = 0; i < m; ++i) norm += B(i, j) * B(i, j);
        result.S[j] = std::sqrt(norm);
    }

    // Selection sort, descending, carrying the vectors along
    for (int i = 0; i < n - 1; ++i) {
        int maxIdx = i;
        for (int j = i + 1; j < n; ++j) {
            if (result.S[j] > result.S[maxIdx]) maxIdx = j;
        }
        if (maxIdx != i) {
            std::swap(result.S[i], result.S[maxIdx]);
            if (computeVectors) {
                for (int k = 0; k < m; ++k) std::swap(B(k, i), B(k, maxIdx));
                for (int k = 0; k < n; ++k) std::swap(V(k, i), V(k, maxIdx));
            }
        }
    }

    if (computeVectors) {
        // Left vectors: normalized columns. Columns of a rank-deficient input
        // stay zero.
        MatX U(m, n);
        for (int j = 0; j < n; ++j) {
            if (result.S[j] <= MATRIX_EPSILON) continue;
            for (int i = 0; i < m; ++i) U(i, j) = B(i, j) / result.S[j];
        }
        if (transpose) {
            result.U = std::move(V);
            result.V = std::move(U);
        } else {
            result.U = std::move(U);
            result.V = std::move(V);
        }
    }

    result.valid = true;
    return result;
}

// =============================================================================
// Numerical Rank
// =============================================================================

double DefaultRankTolerance(const SVDResult& svd, int rows, int cols) {
    return static_cast<double>(std::max(rows, cols)) * SpacingOf(svd.MaxSingularValue());
}

int ComputeRank(const MatX& A, double tolerance) {
    SVDResult svd = SVD_Decompose(A, false);
    if (!svd.valid) {
        return 0;
    }

    double tol = tolerance < 0.0 ? DefaultRankTolerance(svd, A.Rows(), A.Cols()) : tolerance;

    int rank = 0;
    for (int i = 0; i < svd.S.Size(); ++i) {
        if (svd.S[i] > tol) ++rank;
    }
    return rank;
}

} // namespace Circ::Fit::Internal
