#ifndef BROWNIAN_H
#define BROWNIAN_H

#include <string>
#include <vector>
#include "types.h"

enum class PathConstruction { Sequential, PCA };

std::string constructionName(PathConstruction construction);

// Maps d independent standard normals to Brownian motion values at the monitoring times.
//  Sequential: B(t_j) = B(t_{j-1}) + sqrt(t_j - t_{j-1}) z_j
//  PCA:        B = V sqrt(Lambda) z, with C = V Lambda V^T, C_ij = min(t_i, t_j),
//              eigenvalues decreasing so the leading z carry most of the variance
class BrownianMotion {
public:
    BrownianMotion(const std::vector<Real>& times, PathConstruction construction);

    int dimension() const { return static_cast<int>(times_.size()); }
    PathConstruction construction() const { return construction_; }

    // B[0..d) from z[0..d)
    void buildPath(const Real* z, Real* B) const;

    // d×d row-major A with B = A z; A A^T reproduces the covariance
    std::vector<Real> factor() const;

private:
    std::vector<Real> times_;
    PathConstruction construction_;
    std::vector<Real> sqrtDt_;  // sequential
    std::vector<Real> pcaFactor_; // PCA, row-major d×d
};

#endif
