#ifndef SOBOL_WRAPPER_H
#define SOBOL_WRAPPER_H

#include <vector>
#include <cstdint>
#include <boost/random/sobol.hpp>
#include "types.h"

// Scrambled Sobol' points: Joe-Kuo direction numbers from boost, then per coordinate
// a Matousek linear scramble (random lower-triangular bit matrix, unit diagonal)
// followed by a random digital shift. Each seed gives an independent randomized
// copy of the same digital net.
class SobolGenerator{
public:
    using Engine = boost::random::sobol_engine<std::uint32_t, 32>;
    static constexpr int BITS = 32;

    // dimension = number of coordinates per Sobol point
    // seed picks the scramble; scramble = false gives the plain sequence
    // skip is how many points to skip at the start (default 0)
    SobolGenerator(int dimension, std::uint64_t seed, bool scramble = true, std::uint32_t skip = 0);

    int dimension() const { return dim_; }

    // points that can still be drawn before the 32-bit sequence runs out
    static std::uint64_t maxPoints() { return std::uint64_t(1) << BITS; }
    static int maxDimension();

    //gives me a length dimensional vector of real in [0,1)
    std::vector<Real> nextPoint();
    // same, written to out[0..dimension)
    void nextPoint(Real* out);

private:
    std::uint32_t scrambleDigits(int coord, std::uint32_t x) const;

    int dim_;
    bool scramble_;
    std::uint64_t index_;  // next point of the sequence, origin = 0
    Engine engine_;  //32-bit sobol
    // columns_[coord * BITS + p] is the matrix column hit when bit p of the input is set
    std::vector<std::uint32_t> columns_;
    std::vector<std::uint32_t> shift_;
    std::vector<std::uint32_t> ints_;
};

#endif
