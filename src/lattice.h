#ifndef LATTICE_H
#define LATTICE_H

#include <vector>
#include <cstdint>
#include "types.h"

// Shifted rank-1 lattice node sets, extensible in base 2.
// Point k is frac(phi_2(k) z + shift), with phi_2 the van der Corput radical inverse. The first 2^m points are the node set
// {i z / 2^m mod 1}, so doubling n keeps every point already drawn.
class LatticeGenerator{
public:
    static constexpr int LOG2_MAX_POINTS = 20;
    static constexpr int MAX_DIMENSION = 256;

    // seed picks the random shift; shift = false gives the unshifted node set
    LatticeGenerator(int dimension, std::uint64_t seed, bool shift = true);

    int dimension() const { return dim_; }

    static std::uint64_t maxPoints() { return std::uint64_t(1) << LOG2_MAX_POINTS; }
    static int maxDimension();
    // built once, on first use
    static const std::vector<std::uint32_t>& generatingVector();

    std::vector<Real> nextPoint();
    void nextPoint(Real* out);

private:
    int dim_;
    std::uint32_t index_;
    std::vector<std::uint32_t> z_;
    std::vector<Real> shift_;
};

#endif
