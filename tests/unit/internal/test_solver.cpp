/**
 * @file test_solver.cpp
 * @brief Unit tests for Internal/Solver module
 */

#include <CircFit/Internal/Solver.h>
#include <CircFit/Internal/Matrix.h>
#include <CircFit/Core/Constants.h>
#include <CircFit/Core/Exception.h>
#include <gtest/gtest.h>

#include <cmath>
#include <random>

namespace Circ::Fit::Internal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

MatX RandomMatrix(int rows, int cols, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(-10.0, 10.0);
    MatX A(rows, cols);
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            A(i, j) = dist(rng);
        }
    }
    return A;
}

/// U * diag(S) * V^T
MatX Reconstruct(const SVDResult& svd) {
    MatX US = svd.U;
    for (int i = 0; i < US.Rows(); ++i) {
        for (int j = 0; j < US.Cols(); ++j) {
            US(i, j) *= svd.S[j];
        }
    }
    return US * svd.V.Transpose();
}

void ExpectMatrixNear(const MatX& A, const MatX& B, double tol) {
    ASSERT_EQ(A.Rows(), B.Rows());
    ASSERT_EQ(A.Cols(), B.Cols());
    for (int i = 0; i < A.Rows(); ++i) {
        for (int j = 0; j < A.Cols(); ++j) {
            EXPECT_NEAR(A(i, j), B(i, j), tol) << "at (" << i << ", " << j << ")";
        }
    }
}

// =============================================================================
// Triangular Solver Tests
// =============================================================================

TEST(TriangularSolverTest, LowerAndUpper) {
    MatX L{{2.0, 0.0}, {1.0, 4.0}};
    VecX x = SolveLowerTriangular(L, VecX{4.0, 10.0});
    EXPECT_DOUBLE_EQ(x[0], 2.0);
    EXPECT_DOUBLE_EQ(x[1], 2.0);

    MatX U{{2.0, 1.0}, {0.0, 4.0}};
    VecX y = SolveUpperTriangular(U, VecX{5.0, 8.0});
    EXPECT_DOUBLE_EQ(y[1], 2.0);
    EXPECT_DOUBLE_EQ(y[0], 1.5);
}

TEST(TriangularSolverTest, DimensionMismatchThrows) {
    MatX L = MatX::Identity(3);
    EXPECT_THROW(SolveLowerTriangular(L, VecX(2)), InvalidArgumentException);
    EXPECT_THROW(SolveUpperTriangular(L, VecX(4)), InvalidArgumentException);
}

// =============================================================================
// LU Decomposition Tests
// =============================================================================

class LUTest : public ::testing::Test {
protected:
    void SetUp() override { rng_.seed(42); }
    std::mt19937 rng_;
};

TEST_F(LUTest, SolvesKnownSystem) {
    MatX A{{2.0, 1.0, 1.0}, {4.0, -6.0, 0.0}, {-2.0, 7.0, 2.0}};
    VecX b{5.0, -2.0, 9.0};
    VecX x = SolveLU(A, b);
    EXPECT_NEAR(x[0], 1.0, 1e-12);
    EXPECT_NEAR(x[1], 1.0, 1e-12);
    EXPECT_NEAR(x[2], 2.0, 1e-12);
}

TEST_F(LUTest, FactorsReproducePermutedMatrix) {
    for (int trial = 0; trial < 10; ++trial) {
        MatX A = RandomMatrix(4, 4, rng_);
        LUResult lu = LU_Decompose(A);
        ASSERT_TRUE(lu.valid);

        MatX PA(4, 4);
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                PA(i, j) = A(lu.P[i], j);
            }
        }
        ExpectMatrixNear(lu.L * lu.U, PA, 1e-10);
    }
}

TEST_F(LUTest, Determinant) {
    MatX A{{1.0, 2.0}, {3.0, 4.0}};
    EXPECT_NEAR(LU_Decompose(A).Determinant(), -2.0, 1e-12);
}

TEST_F(LUTest, SingularMatrixIsInvalid) {
    MatX A{{1.0, 2.0}, {2.0, 4.0}};
    LUResult lu = LU_Decompose(A);
    EXPECT_FALSE(lu.valid);
    EXPECT_DOUBLE_EQ(lu.Determinant(), 0.0);

    VecX x = SolveLU(A, VecX{1.0, 2.0});
    EXPECT_DOUBLE_EQ(x[0], 0.0);
    EXPECT_DOUBLE_EQ(x[1], 0.0);
}

TEST_F(LUTest, ZeroThresholdOnlyRejectsExactZeroPivots) {
    MatX A{{1e-14, 0.0}, {0.0, 1e-14}};
    EXPECT_FALSE(LU_Decompose(A).valid);
    EXPECT_TRUE(LU_Decompose(A, 0.0).valid);
    EXPECT_FALSE(LU_Decompose(MatX::Zero(2, 2), 0.0).valid);
}

TEST_F(LUTest, NonSquare) {
    MatX A(2, 3);
    std::vector<int> P;
    EXPECT_THROW(LU_DecomposeInPlace(A, P), InvalidArgumentException);
    EXPECT_FALSE(LU_Decompose(A).valid);
}

// =============================================================================
// SVD Tests
// =============================================================================

class SVDTest : public ::testing::Test {
protected:
    void SetUp() override { rng_.seed(7); }
    std::mt19937 rng_;
};

TEST_F(SVDTest, KnownSingularValues) {
    // A^T A = [[25, 20], [20, 25]] with eigenvalues 45 and 5
    MatX A{{3.0, 0.0}, {4.0, 5.0}};
    SVDResult svd = SVD_Decompose(A);
    ASSERT_TRUE(svd.valid);
    ASSERT_EQ(svd.S.Size(), 2);
    EXPECT_NEAR(svd.S[0], std::sqrt(45.0), 1e-12);
    EXPECT_NEAR(svd.S[1], std::sqrt(5.0), 1e-12);
    EXPECT_NEAR(svd.MaxSingularValue(), std::sqrt(45.0), 1e-12);
}

TEST_F(SVDTest, ReconstructsTallMatrix) {
    MatX A = RandomMatrix(6, 3, rng_);
    SVDResult svd = SVD_Decompose(A);
    ASSERT_TRUE(svd.valid);
    ExpectMatrixNear(Reconstruct(svd), A, 1e-10);
    for (int i = 1; i < svd.S.Size(); ++i) {
        EXPECT_GE(svd.S[i - 1], svd.S[i]);
    }
}

TEST_F(SVDTest, ReconstructsWideMatrix) {
    MatX A = RandomMatrix(2, 5, rng_);
    SVDResult svd = SVD_Decompose(A);
    ASSERT_TRUE(svd.valid);
    EXPECT_EQ(svd.S.Size(), 2);
    ExpectMatrixNear(Reconstruct(svd), A, 1e-10);
}

TEST_F(SVDTest, ValuesOnlySkipsVectors) {
    MatX A = RandomMatrix(5, 2, rng_);
    SVDResult full = SVD_Decompose(A);
    SVDResult values = SVD_Decompose(A, false);
    EXPECT_TRUE(values.U.Empty());
    EXPECT_TRUE(values.V.Empty());
    ASSERT_EQ(values.S.Size(), full.S.Size());
    for (int i = 0; i < values.S.Size(); ++i) {
        EXPECT_NEAR(values.S[i], full.S[i], 1e-12);
    }
}

TEST_F(SVDTest, EmptyMatrix) {
    SVDResult svd = SVD_Decompose(MatX());
    EXPECT_TRUE(svd.valid);
    EXPECT_EQ(svd.S.Size(), 0);
    EXPECT_DOUBLE_EQ(svd.MaxSingularValue(), 0.0);
}

// =============================================================================
// Rank Tests
// =============================================================================

TEST(RankTest, FullAndDeficient) {
    EXPECT_EQ(ComputeRank(MatX::Identity(3)), 3);
    EXPECT_EQ(ComputeRank(MatX{{1.0, 2.0}, {2.0, 4.0}, {3.0, 6.0}}), 1);
    EXPECT_EQ(ComputeRank(MatX::Zero(4, 2)), 0);
    EXPECT_EQ(ComputeRank(MatX()), 0);
}

TEST(RankTest, ExplicitTolerance) {
    MatX A{{1.0, 0.0}, {0.0, 1e-6}};
    EXPECT_EQ(ComputeRank(A), 2);
    EXPECT_EQ(ComputeRank(A, 1e-3), 1);
    EXPECT_EQ(ComputeRank(A, 1e-10), 2);
}

TEST(RankTest, DefaultToleranceScalesWithLargestSingularValue) {
    MatX A{{2.0, 0.0}, {0.0, 1.0}, {0.0, 0.0}};
    SVDResult svd = SVD_Decompose(A, false);
    EXPECT_DOUBLE_EQ(DefaultRankTolerance(svd, 3, 2), 3.0 * SpacingOf(2.0));
}

TEST(RankTest, ScaleInvariance) {
    MatX small{{1e-9, 2e-9}, {2e-9, 4e-9}, {-3e-9, -6e-9}};
    MatX large{{1e9, 2e9}, {2e9, 4e9}, {-3e9, -6e9}};
    EXPECT_EQ(ComputeRank(small), 1);
    EXPECT_EQ(ComputeRank(large), 1);
}

} // namespace
} // namespace Circ::Fit::Internal
