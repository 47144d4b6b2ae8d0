#ifndef LINALG_H
#define LINALG_H

#include <vector>
#include "types.h"

// Eigen-decomposition of a symmetric n×n matrix A (row-major) by cyclic Jacobi rotations.
// eigenvalues come back in decreasing order; column k of eigenvectors (row-major n×n)
// is the unit eigenvector of eigenvalues[k].
void symmetricEigen(const std::vector<Real>& A, int n, std::vector<Real>& eigenvalues, std::vector<Real>& eigenvectors);

#endif
