#include "pricing.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <boost/math/distributions/normal.hpp>

inline Real compare(Real A, Real K, PutCallType putCall)
{
    if (putCall == PutCallType::Call) return (A > K ? A - K : 0.0);
    return (A < K ? K - A : 0.0);
}

std::string optionName(const PayoffParams& payoff)
{
    std::string name;
    switch (payoff.optType){
        case OptionType::European:       name = "European"; break;
        case OptionType::ArithmeticMean: name = "Asian arithmetic mean"; break;
        case OptionType::GeometricMean:  name = "Asian geometric mean"; break;
    }
    return name + (payoff.putCallType == PutCallType::Call ? " call" : " put");
}

void validateAssetParams(const AssetPathParams& asset)
{
    requirePositive("initial price", asset.initPrice);
    requireNonNegative("volatility", asset.volatility);
    if (!std::isfinite(asset.interest)){
        throw std::invalid_argument("interest rate must be finite");
    }
    requireIncreasingTimes(asset.timeVector);
}

void validatePayoffParams(const PayoffParams& payoff)
{
    requireNonNegative("strike", payoff.strike);
}

PayoffEvaluator::PayoffEvaluator(const AssetPathParams& asset, const PayoffParams& payoff, PathConstruction construction)
    : asset_(asset), payoffParams_(payoff), bm_(asset.timeVector, construction)
{
    validateAssetParams(asset_);
    validatePayoffParams(payoffParams_);

    const int d = dimension();
    const Real sigma = asset_.volatility;
    drift_.resize(d);
    for (int j = 0; j < d; ++j){
        drift_[j] = std::log(asset_.initPrice) + (asset_.interest - 0.5 * sigma * sigma) * asset_.timeVector[j];
    }
    discount_ = std::exp(-asset_.interest * asset_.timeVector.back());
    z_.resize(d);
    B_.resize(d);
    logS_.resize(d);
}

void PayoffEvaluator::logPath(const Real* u)
{
    const int d = dimension();
    for (int j = 0; j < d; ++j){
        z_[j] = uniformToNormal(u[j]);
    }
    bm_.buildPath(z_.data(), B_.data());
    for (int j = 0; j < d; ++j){
        logS_[j] = drift_[j] + asset_.volatility * B_[j];
    }
}

void PayoffEvaluator::simulatePath(const Real* u, Real* S)
{
    logPath(u);
    for (int j = 0; j < dimension(); ++j){
        S[j] = std::exp(logS_[j]);
    }
}

Real PayoffEvaluator::payoff(const Real* u)
{
    logPath(u);
    const int d = dimension();

    Real A = 0.0;
    switch (payoffParams_.optType){
        case OptionType::European:
            A = std::exp(logS_[d - 1]);
            break;
        case OptionType::GeometricMean: {
            Real sumLog = 0.0;
            for (int j = 0; j < d; ++j) sumLog += logS_[j];
            A = std::exp(sumLog / d);
            break;
        }
        case OptionType::ArithmeticMean: {
            Real sum = 0.0;
            for (int j = 0; j < d; ++j) sum += std::exp(logS_[j]);
            A = sum / d;
            break;
        }
    }
    return discount_ * compare(A, payoffParams_.strike, payoffParams_.putCallType);
}

Real discountedPayoff(const std::vector<Real>& S, const AssetPathParams& asset, const PayoffParams& payoff)
{
    if (S.empty() || S.size() != asset.timeVector.size()){
        throw std::invalid_argument("path length must match the time vector");
    }
    const std::size_t d = S.size();
    Real A = 0.0;
    switch (payoff.optType){
        case OptionType::European:
            A = S[d - 1];
            break;
        case OptionType::GeometricMean: {
            Real sumLog = 0.0;
            for (Real s : S) sumLog += std::log(s);
            A = std::exp(sumLog / d);
            break;
        }
        case OptionType::ArithmeticMean: {
            Real sum = 0.0;
            for (Real s : S) sum += s;
            A = sum / d;
            break;
        }
    }
    return std::exp(-asset.interest * asset.timeVector.back()) * compare(A, payoff.strike, payoff.putCallType);
}

bool hasExactPrice(const PayoffParams& payoff)
{
    return payoff.optType != OptionType::ArithmeticMean;
}

// log A ~ N(mu, v) for A = geometric mean of S over the given times
static void geometricMeanMoments(const AssetPathParams& asset, const std::vector<Real>& times, Real& mu, Real& v)
{
    const std::size_t n = times.size();
    const Real sigma = asset.volatility;
    Real tbar = 0.0;
    for (Real t : times) tbar += t;
    tbar /= n;

    Real sumMin = 0.0;
    for (std::size_t i = 0; i < n; ++i){
        for (std::size_t j = 0; j < n; ++j){
            sumMin += std::min(times[i], times[j]);
        }
    }
    mu = std::log(asset.initPrice) + (asset.interest - 0.5 * sigma * sigma) * tbar;
    v = sigma * sigma * sumMin / (static_cast<Real>(n) * n);
}

Real exactPrice(const AssetPathParams& asset, const PayoffParams& payoff)
{
    validateAssetParams(asset);
    validatePayoffParams(payoff);
    if (!hasExactPrice(payoff)){
        throw std::invalid_argument("no closed form for " + optionName(payoff));
    }

    std::vector<Real> times = asset.timeVector;
    if (payoff.optType == OptionType::European){
        times.assign(1, asset.timeVector.back());
    }

    Real mu = 0.0, v = 0.0;
    geometricMeanMoments(asset, times, mu, v);
    const Real discount = std::exp(-asset.interest * asset.timeVector.back());
    const Real K = payoff.strike;
    const Real forward = std::exp(mu + 0.5 * v); // E[A]

    // deterministic average, or zero strike where the option is always (call) / never (put) exercised
    if (v <= 0.0 || K <= 0.0){
        if (v <= 0.0) return discount * compare(std::exp(mu), K, payoff.putCallType);
        return payoff.putCallType == PutCallType::Call ? discount * forward : 0.0;
    }

    const Real sd = std::sqrt(v);
    const Real d2 = (mu - std::log(K)) / sd;
    const Real d1 = d2 + sd;
    const boost::math::normal_distribution<Real> stdNormal(0.0, 1.0);

    if (payoff.putCallType == PutCallType::Call){
        return discount * (forward * boost::math::cdf(stdNormal, d1) - K * boost::math::cdf(stdNormal, d2));
    }
    return discount * (K * boost::math::cdf(stdNormal, -d2) - forward * boost::math::cdf(stdNormal, -d1));
}
