#ifndef POINT_SET_H
#define POINT_SET_H

#include <vector>
#include <cstdint>
#include <string>
#include "types.h"

enum class SamplingMethod { IID, Sobol, Lattice };

std::string methodName(SamplingMethod method);

// n points of [0,1)^d, row-major
struct PointSet {
    SamplingMethod method;
    int dim;
    int count;
    std::uint64_t seed;
    std::vector<Real> coords;

    const Real* row(int i) const { return &coords[static_cast<std::size_t>(i) * dim]; }
    Real operator()(int i, int j) const { return coords[static_cast<std::size_t>(i) * dim + j]; }
};

// First n points of a randomized point set: IID uniforms, scrambled Sobol' or shifted lattice.
// Throws std::invalid_argument for d <= 0, n <= 0, or sizes a generator cannot produce.
PointSet generatePoints(SamplingMethod method, int d, int n, std::uint64_t seed);

// Hickernell's centered L2 discrepancy; smaller means more even coverage.
Real centeredL2Discrepancy(const PointSet& points);

#endif
