#include "brownian.h"
#include "linalg.h"
#include "utils.h"
#include <algorithm>
#include <cmath>

std::string constructionName(PathConstruction construction)
{
    return construction == PathConstruction::PCA ? "PCA" : "time differencing";
}

BrownianMotion::BrownianMotion(const std::vector<Real>& times, PathConstruction construction)
    : times_(times), construction_(construction)
{
    requireIncreasingTimes(times_);
    const int d = dimension();

    if (construction_ == PathConstruction::Sequential){
        sqrtDt_.resize(d);
        Real prev = 0.0;
        for (int j = 0; j < d; ++j){
            sqrtDt_[j] = std::sqrt(times_[j] - prev);
            prev = times_[j];
        }
        return;
    }

    std::vector<Real> C(static_cast<std::size_t>(d) * d);
    for (int i = 0; i < d; ++i){
        for (int j = 0; j < d; ++j){
            C[i * d + j] = std::min(times_[i], times_[j]);
        }
    }
    std::vector<Real> lambda, V;
    symmetricEigen(C, d, lambda, V);

    pcaFactor_.resize(static_cast<std::size_t>(d) * d);
    for (int k = 0; k < d; ++k){
        // C is positive definite, clip round-off
        Real root = std::sqrt(std::max(lambda[k], Real(0.0)));
        for (int i = 0; i < d; ++i){
            pcaFactor_[i * d + k] = V[i * d + k] * root;
        }
    }
}

void BrownianMotion::buildPath(const Real* z, Real* B) const
{
    const int d = dimension();
    if (construction_ == PathConstruction::Sequential){
        Real b = 0.0;
        for (int j = 0; j < d; ++j){
            b += sqrtDt_[j] * z[j];
            B[j] = b;
        }
        return;
    }
    for (int i = 0; i < d; ++i){
        const Real* a = &pcaFactor_[static_cast<std::size_t>(i) * d];
        Real b = 0.0;
        for (int k = 0; k < d; ++k){
            b += a[k] * z[k];
        }
        B[i] = b;
    }
}

std::vector<Real> BrownianMotion::factor() const
{
    if (construction_ == PathConstruction::PCA) return pcaFactor_;

    const int d = dimension();
    std::vector<Real> A(static_cast<std::size_t>(d) * d, 0.0);
    for (int i = 0; i < d; ++i){
        for (int k = 0; k <= i; ++k){
            A[i * d + k] = sqrtDt_[k];
        }
    }
    return A;
}
