#include "point_set.h"
#include "lattice.h"
#include "sobol_wrapper.h"
#include "utils.h"
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_01.hpp>
#include <cmath>
#include <sstream>
#include <stdexcept>

std::string methodName(SamplingMethod method)
{
    switch (method){
        case SamplingMethod::IID:     return "IID";
        case SamplingMethod::Sobol:   return "Sobol'";
        case SamplingMethod::Lattice: return "lattice";
    }
    return "unknown";
}

template <class Generator>
static void fillPoints(Generator& gen, PointSet& points)
{
    for (int i = 0; i < points.count; ++i){
        gen.nextPoint(&points.coords[static_cast<std::size_t>(i) * points.dim]);
    }
}

static void checkCapacity(std::uint64_t maxPoints, int n, const char* name)
{
    if (static_cast<std::uint64_t>(n) > maxPoints){
        std::ostringstream os;
        os << name << " generator supports at most " << maxPoints << " points, asked for " << n;
        throw std::invalid_argument(os.str());
    }
}

PointSet generatePoints(SamplingMethod method, int d, int n, std::uint64_t seed)
{
    requirePositive("dimension", d);
    requirePositive("number of points", n);

    PointSet points{method, d, n, seed, std::vector<Real>(static_cast<std::size_t>(n) * d)};
    switch (method){
        case SamplingMethod::IID: {
            boost::random::mt19937_64 rng(seed);
            boost::random::uniform_01<Real> unif;
            for (Real& x : points.coords) x = unif(rng);
            break;
        }
        case SamplingMethod::Sobol: {
            checkCapacity(SobolGenerator::maxPoints(), n, "Sobol");
            SobolGenerator sobol(d, seed);
            fillPoints(sobol, points);
            break;
        }
        case SamplingMethod::Lattice: {
            checkCapacity(LatticeGenerator::maxPoints(), n, "lattice");
            LatticeGenerator lattice(d, seed);
            fillPoints(lattice, points);
            break;
        }
    }
    return points;
}

Real centeredL2Discrepancy(const PointSet& points)
{
    const int n = points.count;
    const int d = points.dim;

    Real term1 = std::pow(13.0 / 12.0, d);

    Real sum2 = 0.0;
    for (int i = 0; i < n; ++i){
        Real prod = 1.0;
        for (int k = 0; k < d; ++k){
            Real a = std::fabs(points(i, k) - 0.5);
            prod *= 1.0 + 0.5 * a - 0.5 * a * a;
        }
        sum2 += prod;
    }

    Real sum3 = 0.0;
    for (int i = 0; i < n; ++i){
        for (int j = 0; j < n; ++j){
            Real prod = 1.0;
            for (int k = 0; k < d; ++k){
                Real ai = std::fabs(points(i, k) - 0.5);
                Real aj = std::fabs(points(j, k) - 0.5);
                Real aij = std::fabs(points(i, k) - points(j, k));
                prod *= 1.0 + 0.5 * ai + 0.5 * aj - 0.5 * aij;
            }
            sum3 += prod;
        }
    }

    Real sq = term1 - 2.0 / n * sum2 + sum3 / (static_cast<Real>(n) * n);
    return std::sqrt(sq > 0.0 ? sq : 0.0);
}
