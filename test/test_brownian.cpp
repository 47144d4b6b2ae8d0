#include <gtest/gtest.h>
#include "brownian.h"
#include "linalg.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

// A A^T for a row-major d×d A
std::vector<Real> gram(const std::vector<Real>& A, int d) {
    std::vector<Real> C(static_cast<std::size_t>(d) * d, 0.0);
    for (int i = 0; i < d; ++i)
        for (int j = 0; j < d; ++j)
            for (int k = 0; k < d; ++k)
                C[i * d + j] += A[i * d + k] * A[j * d + k];
    return C;
}

} // namespace

TEST(LinalgTest, EigenOfDiagonalIsSorted) {
    std::vector<Real> A = {1.0, 0.0, 0.0,
                           0.0, 3.0, 0.0,
                           0.0, 0.0, 2.0};
    std::vector<Real> lambda, V;
    symmetricEigen(A, 3, lambda, V);
    EXPECT_DOUBLE_EQ(lambda[0], 3.0);
    EXPECT_DOUBLE_EQ(lambda[1], 2.0);
    EXPECT_DOUBLE_EQ(lambda[2], 1.0);
    EXPECT_DOUBLE_EQ(std::fabs(V[1 * 3 + 0]), 1.0);
}

TEST(LinalgTest, EigenReconstructsMatrix) {
    std::vector<Real> A = {4.0, 1.0, 0.5,
                           1.0, 3.0, 0.2,
                           0.5, 0.2, 1.0};
    std::vector<Real> lambda, V;
    symmetricEigen(A, 3, lambda, V);
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            Real sum = 0.0;
            for (int k = 0; k < 3; ++k) sum += V[i * 3 + k] * lambda[k] * V[j * 3 + k];
            EXPECT_NEAR(sum, A[i * 3 + j], 1e-12);
        }
    }
    EXPECT_TRUE(std::is_sorted(lambda.rbegin(), lambda.rend()));
}

TEST(LinalgTest, RejectsBadShape) {
    std::vector<Real> lambda, V;
    EXPECT_THROW(symmetricEigen(std::vector<Real>(5, 1.0), 2, lambda, V), std::invalid_argument);
}

TEST(BrownianTest, BothConstructionsReproduceCovariance) {
    std::vector<Real> times = uniformTimeVector(1.0 / 52, 13);
    for (PathConstruction c : {PathConstruction::Sequential, PathConstruction::PCA}) {
        BrownianMotion bm(times, c);
        std::vector<Real> C = gram(bm.factor(), 13);
        for (int i = 0; i < 13; ++i)
            for (int j = 0; j < 13; ++j)
                EXPECT_NEAR(C[i * 13 + j], std::min(times[i], times[j]), 1e-12) << constructionName(c);
    }
}

TEST(BrownianTest, PcaPutsMostVarianceInFirstCoordinate) {
    std::vector<Real> times = uniformTimeVector(1.0 / 52, 13);
    BrownianMotion bm(times, PathConstruction::PCA);
    std::vector<Real> A = bm.factor();
    Real first = 0.0, total = 0.0;
    for (int i = 0; i < 13; ++i) {
        for (int k = 0; k < 13; ++k) {
            total += A[i * 13 + k] * A[i * 13 + k];
            if (k == 0) first += A[i * 13 + k] * A[i * 13 + k];
        }
    }
    // the leading eigenvalue of min(s,t) carries about 80% of the trace
    EXPECT_GT(first / total, 0.75);
}

TEST(BrownianTest, SequentialPathIsCumulativeSum) {
    std::vector<Real> times = {0.25, 1.0, 2.0};
    BrownianMotion bm(times, PathConstruction::Sequential);
    Real z[3] = {1.0, -1.0, 2.0};
    Real B[3];
    bm.buildPath(z, B);
    EXPECT_DOUBLE_EQ(B[0], 0.5);
    EXPECT_DOUBLE_EQ(B[1], 0.5 - std::sqrt(0.75));
    EXPECT_DOUBLE_EQ(B[2], 0.5 - std::sqrt(0.75) + 2.0);
}

TEST(BrownianTest, RejectsBadTimeVectors) {
    EXPECT_THROW(BrownianMotion({}, PathConstruction::PCA), std::invalid_argument);
    EXPECT_THROW(BrownianMotion({0.5, 0.5}, PathConstruction::Sequential), std::invalid_argument);
    EXPECT_THROW(BrownianMotion({0.5, 0.25}, PathConstruction::PCA), std::invalid_argument);
    EXPECT_THROW(BrownianMotion({0.0, 0.25}, PathConstruction::Sequential), std::invalid_argument);
}
