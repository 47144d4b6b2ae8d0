#include "sobol_wrapper.h"
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

int SobolGenerator::maxDimension()
{
    return static_cast<int>(boost::random::default_sobol_table::max_dimension);
}

SobolGenerator::SobolGenerator(int dimension, std::uint64_t seed, bool scramble, std::uint32_t skip)
    : dim_(dimension), scramble_(scramble), index_(skip),
      engine_(static_cast<std::size_t>(dimension > 0 ? dimension : 1)), ints_(dimension > 0 ? dimension : 0){
    if (dimension <= 0 || dimension > maxDimension()){
        std::ostringstream os;
        os << "Sobol dimension must be in [1, " << maxDimension() << "], got " << dimension;
        throw std::invalid_argument(os.str());
    }

    if (scramble_){
        boost::random::mt19937_64 rng(seed);
        boost::random::uniform_int_distribution<std::uint32_t> bits;
        columns_.resize(static_cast<std::size_t>(dim_) * BITS);
        shift_.resize(dim_);
        for (int j = 0; j < dim_; ++j){
            // input digit at bit p only feeds output digits at bit p and below
            for (int p = BITS - 1; p >= 0; --p){
                std::uint32_t diag = std::uint32_t(1) << p;
                columns_[j * BITS + p] = diag | (bits(rng) & (diag - 1));
            }
            shift_[j] = bits(rng);
        }
    }

    //skip that many points at beg; the engine starts at point 1, the origin is ours
    if (skip > 0){
        engine_.discard(static_cast<boost::uintmax_t>(skip - 1) * dim_);
    }
}

std::uint32_t SobolGenerator::scrambleDigits(int coord, std::uint32_t x) const
{
    const std::uint32_t* col = &columns_[coord * BITS];
    std::uint32_t y = shift_[coord];
    for (int p = 0; x != 0; ++p, x >>= 1){
        if (x & 1u) y ^= col[p];
    }
    return y;
}

void SobolGenerator::nextPoint(Real* out)
{
    if (index_ == maxPoints()){
        throw std::range_error("Sobol generator exhausted its 2^32 points");
    }
    // point 0 is the origin, every later point comes from the engine
    if (index_ == 0){
        std::fill(ints_.begin(), ints_.end(), 0u);
    }
    else{
        engine_.generate(ints_.begin(), ints_.end());
    }
    ++index_;

    // midpoint of the 2^-32 cell, so the result is in (0,1)
    const Real denom = 4294967296.0; // = 2^32
    for (int j = 0; j < dim_; ++j){
        std::uint32_t x = scramble_ ? scrambleDigits(j, ints_[j]) : ints_[j];
        out[j] = (static_cast<Real>(x) + 0.5) / denom;
    }
}

std::vector<Real> SobolGenerator::nextPoint()
{
    std::vector<Real> result(dim_);
    nextPoint(result.data());
    return result;
}
