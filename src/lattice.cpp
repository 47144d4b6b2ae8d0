#include "lattice.h"
#include <boost/math/constants/constants.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_01.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <limits>
#include <sstream>
#include <stdexcept>

// Search parameters of the embedded generating vector
static const int CBC_LOG2_MIN = 10;
static const int CBC_LOG2_MAX = 13;
static const int CBC_CANDIDATES = 32;
static const std::uint64_t CBC_SEED = 20060101;

// Component-by-component construction of an embedded base-2 generating vector
// (Cools, Kuo and Nuyens, SIAM J. Sci. Comput. 28, 2006). Coordinate j keeps, among
// random odd candidates, the one with the smallest summed squared shift-averaged
// worst-case error (Korobov space, smoothness 1, weights 1/j^2) over the node sets of
// 2^CBC_LOG2_MIN .. 2^CBC_LOG2_MAX points, each level scaled by n^2.
// Every entry is odd, so each one-dimensional projection of 2^m points is the full grid {i / 2^m}.
static std::vector<std::uint32_t> buildGeneratingVector()
{
    const int levels = CBC_LOG2_MAX - CBC_LOG2_MIN + 1;
    const Real pi = boost::math::constants::pi<Real>();

    // omega[l][k] = 2 pi^2 B_2(k / n_l), prod[l][k] = running product over chosen coordinates
    std::vector<std::vector<Real>> omega(levels), prod(levels);
    for (int l = 0; l < levels; ++l){
        const std::uint32_t n = 1u << (CBC_LOG2_MIN + l);
        omega[l].resize(n);
        prod[l].assign(n, 1.0);
        for (std::uint32_t k = 0; k < n; ++k){
            Real x = static_cast<Real>(k) / n;
            omega[l][k] = 2.0 * pi * pi * (x * x - x + 1.0 / 6.0);
        }
    }

    boost::random::mt19937_64 rng(CBC_SEED);
    boost::random::uniform_int_distribution<std::uint32_t> half(0, (1u << (LatticeGenerator::LOG2_MAX_POINTS - 1)) - 1);

    std::vector<std::uint32_t> z;
    z.reserve(LatticeGenerator::MAX_DIMENSION);
    for (int j = 0; j < LatticeGenerator::MAX_DIMENSION; ++j){
        const Real gamma = 1.0 / ((j + 1.0) * (j + 1.0));
        std::uint32_t best = 1;
        if (j > 0){
            Real bestErr = std::numeric_limits<Real>::max();
            for (int c = 0; c < CBC_CANDIDATES; ++c){
                const std::uint32_t cand = 2 * half(rng) + 1;
                Real err = 0.0;
                for (int l = 0; l < levels; ++l){
                    const std::uint32_t n = static_cast<std::uint32_t>(prod[l].size());
                    const std::uint32_t mask = n - 1;
                    Real sum = 0.0;
                    // k * cand wraps mod 2^32, which keeps it exact mod n
                    for (std::uint32_t k = 0; k < n; ++k){
                        sum += prod[l][k] * (1.0 + gamma * omega[l][(k * cand) & mask]);
                    }
                    err += (sum / n - 1.0) * n * n;
                }
                if (err < bestErr){
                    bestErr = err;
                    best = cand;
                }
            }
        }
        for (int l = 0; l < levels; ++l){
            const std::uint32_t mask = static_cast<std::uint32_t>(prod[l].size()) - 1;
            for (std::uint32_t k = 0; k <= mask; ++k){
                prod[l][k] *= 1.0 + gamma * omega[l][(k * best) & mask];
            }
        }
        z.push_back(best);
    }
    return z;
}

const std::vector<std::uint32_t>& LatticeGenerator::generatingVector()
{
    static const std::vector<std::uint32_t> z = buildGeneratingVector();
    return z;
}

int LatticeGenerator::maxDimension()
{
    return MAX_DIMENSION;
}

// reverse the low LOG2_MAX_POINTS bits of k
static std::uint32_t reverseBits(std::uint32_t k)
{
    std::uint32_t r = 0;
    for (int b = 0; b < LatticeGenerator::LOG2_MAX_POINTS; ++b){
        r = (r << 1) | (k & 1u);
        k >>= 1;
    }
    return r;
}

LatticeGenerator::LatticeGenerator(int dimension, std::uint64_t seed, bool shift)
    : dim_(dimension), index_(0){
    if (dimension <= 0 || dimension > maxDimension()){
        std::ostringstream os;
        os << "lattice dimension must be in [1, " << maxDimension() << "], got " << dimension;
        throw std::invalid_argument(os.str());
    }
    const std::vector<std::uint32_t>& z = generatingVector();
    z_.assign(z.begin(), z.begin() + dim_);
    shift_.assign(dim_, 0.0);
    if (shift){
        boost::random::mt19937_64 rng(seed);
        boost::random::uniform_01<Real> unif;
        for (int j = 0; j < dim_; ++j){
            shift_[j] = unif(rng);
        }
    }
}

void LatticeGenerator::nextPoint(Real* out)
{
    if (index_ >= maxPoints()){
        throw std::range_error("lattice generator exhausted its 2^20 points");
    }
    const std::uint32_t mask = static_cast<std::uint32_t>(maxPoints() - 1);
    const Real denom = static_cast<Real>(maxPoints());
    // phi_2(k) * 2^20, exact in integers
    std::uint64_t k = reverseBits(index_++);
    for (int j = 0; j < dim_; ++j){
        std::uint32_t node = static_cast<std::uint32_t>((k * z_[j]) & mask);
        Real x = static_cast<Real>(node) / denom + shift_[j];
        if (x >= 1.0) x -= 1.0;
        out[j] = x;
    }
}

std::vector<Real> LatticeGenerator::nextPoint()
{
    std::vector<Real> result(dim_);
    nextPoint(result.data());
    return result;
}
