#include "linalg.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

// sum of squares above the diagonal, the Jacobi sweep drives this to zero
static Real offDiagonalNorm(const std::vector<Real>& M, int n){
    Real off = 0.0;
    for (int i = 0; i < n; ++i){
        for (int j = i + 1; j < n; ++j){
            off += M[i * n + j] * M[i * n + j];
        }
    }
    return off;
}

// Rotate rows/cols p and q of M so that M[p][q] becomes zero; accumulate rotation in V
static void jacobiRotate(std::vector<Real>& M, std::vector<Real>& V, int n, int p, int q){
    Real apq = M[p * n + q];
    if (apq == 0.0) return;

    Real theta = (M[q * n + q] - M[p * n + p]) / (2.0 * apq);
    Real t = (theta >= 0.0 ? 1.0 : -1.0) / (std::fabs(theta) + std::sqrt(theta * theta + 1.0));
    Real c = 1.0 / std::sqrt(t * t + 1.0);
    Real s = t * c;

    for (int k = 0; k < n; ++k){
        Real mkp = M[k * n + p];
        Real mkq = M[k * n + q];
        M[k * n + p] = c * mkp - s * mkq;
        M[k * n + q] = s * mkp + c * mkq;
    }
    for (int k = 0; k < n; ++k){
        Real mpk = M[p * n + k];
        Real mqk = M[q * n + k];
        M[p * n + k] = c * mpk - s * mqk;
        M[q * n + k] = s * mpk + c * mqk;
    }
    for (int k = 0; k < n; ++k){
        Real vkp = V[k * n + p];
        Real vkq = V[k * n + q];
        V[k * n + p] = c * vkp - s * vkq;
        V[k * n + q] = s * vkp + c * vkq;
    }
}

void symmetricEigen(const std::vector<Real>& A, int n, std::vector<Real>& eigenvalues, std::vector<Real>& eigenvectors){
    if (n <= 0 || A.size() != static_cast<std::size_t>(n) * n){
        throw std::invalid_argument("symmetricEigen: matrix must be n x n with n > 0");
    }

    std::vector<Real> M(A);
    std::vector<Real> V(static_cast<std::size_t>(n) * n, 0.0);
    for (int i = 0; i < n; ++i) V[i * n + i] = 1.0;

    Real scale = 0.0;
    for (Real a : A) scale += a * a;
    const Real eps = 1e-30 * std::max(scale, Real(1e-300));

    const int maxSweeps = 100;
    for (int sweep = 0; sweep < maxSweeps && offDiagonalNorm(M, n) > eps; ++sweep){
        for (int p = 0; p < n - 1; ++p){
            for (int q = p + 1; q < n; ++q){
                jacobiRotate(M, V, n, p, q);
            }
        }
    }

    // sort eigenpairs by decreasing eigenvalue
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](int a, int b){ return M[a * n + a] > M[b * n + b]; });

    eigenvalues.assign(n, 0.0);
    eigenvectors.assign(static_cast<std::size_t>(n) * n, 0.0);
    for (int k = 0; k < n; ++k){
        int src = order[k];
        eigenvalues[k] = M[src * n + src];
        for (int i = 0; i < n; ++i){
            eigenvectors[i * n + k] = V[i * n + src];
        }
    }
}
