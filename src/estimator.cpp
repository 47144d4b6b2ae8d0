#include "estimator.h"
#include "lattice.h"
#include "sobol_wrapper.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_01.hpp>

PriceRequest::PriceRequest(const AssetPathParams& asset, const PayoffParams& payoff, const ToleranceSpec& tol)
    : asset_(asset), payoff_(payoff), tol_(tol)
{
}

PriceRequest PriceRequest::withCubMethod(SamplingMethod method) const
{
    PriceRequest copy(*this);
    copy.method_ = method;
    return copy;
}

PriceRequest PriceRequest::withAssembleType(PathConstruction construction) const
{
    PriceRequest copy(*this);
    copy.construction_ = construction;
    return copy;
}

PriceRequest PriceRequest::withTolerance(const ToleranceSpec& tol) const
{
    PriceRequest copy(*this);
    copy.tol_ = tol;
    return copy;
}

PriceRequest PriceRequest::withAlpha(Real alpha) const
{
    PriceRequest copy(*this);
    copy.alpha_ = alpha;
    return copy;
}

PriceRequest PriceRequest::withMaxSamples(std::uint64_t nMax) const
{
    PriceRequest copy(*this);
    copy.nMax_ = nMax;
    return copy;
}

PriceRequest PriceRequest::withReplicates(int replicates) const
{
    PriceRequest copy(*this);
    copy.replicates_ = replicates;
    return copy;
}

PriceRequest PriceRequest::withSeed(std::uint64_t seed) const
{
    PriceRequest copy(*this);
    copy.seed_ = seed;
    return copy;
}

Real toleranceBound(const ToleranceSpec& tol, Real price)
{
    return std::max(tol.absTol, tol.relTol * std::fabs(price));
}

void validateRequest(const PriceRequest& request)
{
    validateAssetParams(request.assetParams());
    validatePayoffParams(request.payoffParams());

    const ToleranceSpec& tol = request.tolerance();
    requireNonNegative("absolute tolerance", tol.absTol);
    requireNonNegative("relative tolerance", tol.relTol);
    if (tol.absTol == 0.0 && tol.relTol == 0.0){
        throw std::invalid_argument("absolute and relative tolerance cannot both be zero");
    }
    if (!(request.alpha() > 0.0 && request.alpha() < 1.0)){
        throw std::invalid_argument("alpha must be in (0, 1)");
    }

    const int d = static_cast<int>(request.assetParams().timeVector.size());
    std::ostringstream os;
    switch (request.cubMethod()){
        case SamplingMethod::IID:
            if (request.maxSamples() < 2){
                throw std::invalid_argument("IID sampling needs a budget of at least 2 samples");
            }
            break;
        case SamplingMethod::Sobol:
        case SamplingMethod::Lattice: {
            int maxDim = request.cubMethod() == SamplingMethod::Sobol ? SobolGenerator::maxDimension()
                                                                      : LatticeGenerator::maxDimension();
            if (d > maxDim){
                os << methodName(request.cubMethod()) << " sampling supports at most " << maxDim
                   << " monitoring dates, got " << d;
                throw std::invalid_argument(os.str());
            }
            if (request.replicates() < 2){
                throw std::invalid_argument("need at least 2 randomized replicates to estimate the error");
            }
            if (request.maxSamples() < static_cast<std::uint64_t>(request.replicates())){
                os << "sample budget " << request.maxSamples() << " is smaller than the "
                   << request.replicates() << " replicates";
                throw std::invalid_argument(os.str());
            }
            break;
        }
    }
}

static void warnBudget(const PriceRequest& request, std::uint64_t nSamples, Real err, Real tol)
{
    std::cerr << "Warning: " << methodName(request.cubMethod()) << " sampling used " << nSamples
              << " of its " << request.maxSamples() << " sample budget with error bound " << err
              << " above the tolerance " << tol << "; the answer may not be within tolerance.\n";
}

static void warnCapacity(const PriceRequest& request, std::uint64_t perReplicate, Real err, Real tol)
{
    std::cerr << "Warning: " << methodName(request.cubMethod()) << " sampling reached the capacity of its generator ("
              << perReplicate << " points per replicate, " << perReplicate * request.replicates()
              << " samples) with error bound " << err << " above the tolerance " << tol
              << "; the answer may not be within tolerance.\n";
}

// zero volatility: every path is the same, one evaluation is exact
static PriceEstimate deterministicPrice(const PriceRequest& request, PayoffEvaluator& evaluator, const Timer& timer)
{
    std::vector<Real> u(evaluator.dimension(), 0.5);
    Real price = evaluator.payoff(u.data());
    return PriceEstimate{price, 0.0, 1, 1, timer.elapsed(), EstimateStatus::Converged, request.cubMethod()};
}

// IID: total sample count doubles each round, error from the (inflated) CLT half-width
static PriceEstimate iidPrice(const PriceRequest& request, PayoffEvaluator& evaluator, const Timer& timer)
{
    const int d = evaluator.dimension();
    const std::uint64_t nMax = request.maxSamples();
    const boost::math::normal_distribution<Real> stdNormal(0.0, 1.0);
    const Real z = boost::math::quantile(stdNormal, 1.0 - request.alpha() / 2);

    boost::random::mt19937_64 rng(request.seed());
    boost::random::uniform_01<Real> unif;
    std::vector<Real> u(d);

    long double sum = 0.0L, sumSq = 0.0L;
    std::uint64_t n = 0;
    std::uint64_t batch = std::min(N_IID_INIT_DEFAULT, nMax);
    int rounds = 0;
    Real mean = 0.0, err = 0.0;

    EstimatorState state = EstimatorState::Initializing;
    while (state != EstimatorState::Converged && state != EstimatorState::ExhaustedBudget){
        switch (state){
            case EstimatorState::Initializing:
                state = EstimatorState::Sampling;
                break;
            case EstimatorState::Sampling:
                for (std::uint64_t i = 0; i < batch; ++i){
                    for (int j = 0; j < d; ++j) u[j] = unif(rng);
                    Real y = evaluator.payoff(u.data());
                    sum += y;
                    sumSq += static_cast<long double>(y) * y;
                }
                n += batch;
                ++rounds;
                state = EstimatorState::CheckingTolerance;
                break;
            case EstimatorState::CheckingTolerance: {
                long double m = sum / n;
                long double var = (sumSq - n * m * m) / (n - 1);
                mean = static_cast<Real>(m);
                err = z * INFLATE_DEFAULT * std::sqrt(static_cast<Real>(std::max(var, 0.0L)) / n);
                if (err <= toleranceBound(request.tolerance(), mean)){
                    state = EstimatorState::Converged;
                }
                else if (n >= nMax){
                    state = EstimatorState::ExhaustedBudget;
                }
                else{
                    batch = std::min(n, nMax - n);
                    state = EstimatorState::Sampling;
                }
                break;
            }
            default:
                break;
        }
    }

    if (state == EstimatorState::ExhaustedBudget){
        warnBudget(request, n, err, toleranceBound(request.tolerance(), mean));
        return PriceEstimate{mean, err, n, rounds, timer.elapsed(), EstimateStatus::BudgetExhausted, request.cubMethod()};
    }
    return PriceEstimate{mean, err, n, rounds, timer.elapsed(), EstimateStatus::Converged, request.cubMethod()};
}

// QMC: R independently randomized copies of the same extensible point set, all
// extended to twice their size each round; error from the spread of the copy means
template <class Generator>
static PriceEstimate replicatedPrice(const PriceRequest& request, PayoffEvaluator& evaluator, const Timer& timer)
{
    const int d = evaluator.dimension();
    const int R = request.replicates();
    const boost::math::students_t_distribution<Real> tDist(R - 1);
    const Real t = boost::math::quantile(tDist, 1.0 - request.alpha() / 2);

    // points per replicate may not exceed the generator capacity nor the budget share
    const bool capacityBound = Generator::maxPoints() < request.maxSamples() / R;
    const std::uint64_t cap = std::min(Generator::maxPoints(), request.maxSamples() / R);
    std::uint64_t target = N_QMC_INIT_DEFAULT;
    while (target > cap) target >>= 1;

    std::vector<Generator> gens;
    gens.reserve(R);
    boost::random::mt19937_64 seeder(request.seed());
    for (int r = 0; r < R; ++r){
        gens.emplace_back(d, seeder());
    }
    std::vector<long double> sums(R, 0.0L);
    std::vector<Real> u(d);

    std::uint64_t drawn = 0; // per replicate
    int rounds = 0;
    Real mean = 0.0, err = 0.0;

    EstimatorState state = EstimatorState::Initializing;
    while (state != EstimatorState::Converged && state != EstimatorState::ExhaustedBudget){
        switch (state){
            case EstimatorState::Initializing:
                state = EstimatorState::Sampling;
                break;
            case EstimatorState::Sampling:
                for (int r = 0; r < R; ++r){
                    for (std::uint64_t k = drawn; k < target; ++k){
                        gens[r].nextPoint(u.data());
                        sums[r] += evaluator.payoff(u.data());
                    }
                }
                drawn = target;
                ++rounds;
                state = EstimatorState::CheckingTolerance;
                break;
            case EstimatorState::CheckingTolerance: {
                std::vector<Real> means(R);
                long double total = 0.0L;
                for (int r = 0; r < R; ++r){
                    means[r] = static_cast<Real>(sums[r] / drawn);
                    total += means[r];
                }
                mean = static_cast<Real>(total / R);
                Real ss = 0.0;
                for (Real m : means) ss += (m - mean) * (m - mean);
                err = t * std::sqrt(ss / (R - 1)) / std::sqrt(static_cast<Real>(R));

                if (err <= toleranceBound(request.tolerance(), mean)){
                    state = EstimatorState::Converged;
                }
                else if (2 * drawn > cap){
                    state = EstimatorState::ExhaustedBudget;
                }
                else{
                    target = 2 * drawn;
                    state = EstimatorState::Sampling;
                }
                break;
            }
            default:
                break;
        }
    }

    const std::uint64_t nSamples = drawn * R;
    if (state == EstimatorState::ExhaustedBudget){
        if (capacityBound){
            warnCapacity(request, drawn, err, toleranceBound(request.tolerance(), mean));
        }
        else{
            warnBudget(request, nSamples, err, toleranceBound(request.tolerance(), mean));
        }
        return PriceEstimate{mean, err, nSamples, rounds, timer.elapsed(), EstimateStatus::BudgetExhausted, request.cubMethod()};
    }
    return PriceEstimate{mean, err, nSamples, rounds, timer.elapsed(), EstimateStatus::Converged, request.cubMethod()};
}

PriceEstimate genOptPrice(const PriceRequest& request)
{
    // start timer to test simulation speed
    Timer timer;
    timer.reset();

    validateRequest(request);
    PayoffEvaluator evaluator(request.assetParams(), request.payoffParams(), request.assembleType());

    if (request.assetParams().volatility == 0.0){
        return deterministicPrice(request, evaluator, timer);
    }

    switch (request.cubMethod()){
        case SamplingMethod::Sobol:
            return replicatedPrice<SobolGenerator>(request, evaluator, timer);
        case SamplingMethod::Lattice:
            return replicatedPrice<LatticeGenerator>(request, evaluator, timer);
        case SamplingMethod::IID:
        default:
            return iidPrice(request, evaluator, timer);
    }
}
